#pragma once

#include "yankring/entry.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace yankring {

struct CacheStats {
    size_t entryCount {0};
    int64_t totalBytes {0};
    std::map<std::string, size_t> byContentType;
    std::map<EntryKind, size_t> byKind;
};

// Bounded, newest-first mirror of the most recent entries. Duplicates are kept.
class HistoryCache {
public:
    static constexpr size_t kDefaultSearchLimit = 20;

    explicit HistoryCache(size_t max_size = 100);

    void add(HistoryEntry entry);
    // Replaces everything with the first maxSize() of entries (newest first).
    void setAll(const std::vector<HistoryEntry>& entries);

    std::optional<HistoryEntry> get(size_t index) const;
    std::vector<HistoryEntry> getAll() const;
    std::vector<HistoryEntry> getRecent(size_t limit) const;

    // Moves the entry with this id to index 0. True if found (also when already first).
    bool moveToFront(int64_t id);

    // Case-insensitive substring match on content
    std::vector<HistoryEntry> search(const std::string& query, size_t limit = kDefaultSearchLimit) const;
    std::vector<HistoryEntry> filterByChannelType(const std::string& tag) const;

    CacheStats stats() const;

    void clear();
    size_t size() const;
    size_t maxSize() const { return max_size_; }

private:
    size_t max_size_;
    std::vector<HistoryEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace yankring
