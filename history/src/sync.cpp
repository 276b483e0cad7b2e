#include "yankring/sync.hpp"
#include <algorithm>
#include <string>

namespace yankring {

SyncCoordinator::SyncCoordinator(IEntryStore& store, HistoryCache& cache, size_t max_entries, const Logger& log)
    : store_(store), cache_(cache), max_entries_(max_entries), log_(log) {}

bool SyncCoordinator::syncIfNeeded() {
    std::lock_guard<std::mutex> lock(mutex_);
    const SyncStatus current = store_.syncStatus();
    if (last_ && *last_ == current) {
        return false;
    }

    log_.debug("sync", "changes detected (count " + std::to_string(last_ ? last_->entryCount : -1) + " -> " +
                           std::to_string(current.entryCount) + "), reloading");
    auto entries = store_.recent(max_entries_);
    cache_.setAll(entries);
    last_ = current;
    log_.debug("sync", "synced " + std::to_string(entries.size()) + " entries");
    return true;
}

std::optional<SyncStatus> SyncCoordinator::lastStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

void SyncCoordinator::updateStatus() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_ = store_.syncStatus();
}

bool SyncCoordinator::noteLocalAppend(const HistoryEntry& stored) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_) return false;
    SyncStatus expected;
    expected.lastTimestamp = std::max(last_->lastTimestamp, stored.timestamp);
    expected.entryCount = std::min<int64_t>(last_->entryCount + 1, static_cast<int64_t>(store_.maxEntries()));
    const SyncStatus current = store_.syncStatus();
    if (current != expected) {
        log_.debug("sync", "store changed elsewhere, reload pending");
        return false;
    }
    last_ = current;
    return true;
}

} // namespace yankring
