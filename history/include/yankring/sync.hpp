#pragma once

#include "yankring/cache.hpp"
#include "yankring/log.hpp"
#include "yankring/store.hpp"
#include <mutex>
#include <optional>

namespace yankring {

// Keeps the cache in step with a store that other processes may also write to.
class SyncCoordinator {
public:
    SyncCoordinator(IEntryStore& store, HistoryCache& cache, size_t max_entries, const Logger& log);

    // One status read; reloads the cache only if (lastTimestamp, entryCount)
    // changed since the last observation. Returns true when a reload happened.
    bool syncIfNeeded();

    std::optional<SyncStatus> lastStatus() const;
    // Remembers the store's current status without reloading
    void updateStatus();

    // Called after this process appended `stored` and added it to the cache.
    // Adopts the new status without a reload when it is exactly what that one
    // append produces; otherwise the next syncIfNeeded() reloads.
    bool noteLocalAppend(const HistoryEntry& stored);

private:
    IEntryStore& store_;
    HistoryCache& cache_;
    size_t max_entries_;
    const Logger& log_;
    std::optional<SyncStatus> last_;
    mutable std::mutex mutex_;
};

} // namespace yankring
