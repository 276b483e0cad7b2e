#include "yankring/cache.hpp"
#include <algorithm>
#include <cctype>

namespace yankring {

static std::string to_lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

HistoryCache::HistoryCache(size_t max_size) : max_size_(max_size) {}

void HistoryCache::add(HistoryEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert(entries_.begin(), std::move(entry));
    if (entries_.size() > max_size_) entries_.resize(max_size_);
}

void HistoryCache::setAll(const std::vector<HistoryEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = std::min(entries.size(), max_size_);
    entries_.assign(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(n));
}

std::optional<HistoryEntry> HistoryCache::get(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= entries_.size()) return std::nullopt;
    return entries_[index];
}

std::vector<HistoryEntry> HistoryCache::getAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::vector<HistoryEntry> HistoryCache::getRecent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = std::min(limit, entries_.size());
    return std::vector<HistoryEntry>(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(n));
}

bool HistoryCache::moveToFront(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const HistoryEntry& e) { return e.id && *e.id == id; });
    if (it == entries_.end()) return false;
    // rotate keeps the relative order of everything before the target
    std::rotate(entries_.begin(), it, it + 1);
    return true;
}

std::vector<HistoryEntry> HistoryCache::search(const std::string& query, size_t limit) const {
    const std::string needle = to_lower(query);
    std::vector<HistoryEntry> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (out.size() >= limit) break;
        if (to_lower(e.content).find(needle) != std::string::npos) out.push_back(e);
    }
    return out;
}

std::vector<HistoryEntry> HistoryCache::filterByChannelType(const std::string& tag) const {
    std::vector<HistoryEntry> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries_) {
        if (e.sourceContentType && *e.sourceContentType == tag) out.push_back(e);
    }
    return out;
}

CacheStats HistoryCache::stats() const {
    CacheStats s;
    s.byKind[EntryKind::Charwise] = 0;
    s.byKind[EntryKind::Linewise] = 0;
    s.byKind[EntryKind::Blockwise] = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    s.entryCount = entries_.size();
    for (const auto& e : entries_) {
        s.totalBytes += e.size;
        if (e.sourceContentType) ++s.byContentType[*e.sourceContentType];
        ++s.byKind[e.kind];
    }
    return s;
}

void HistoryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t HistoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace yankring
