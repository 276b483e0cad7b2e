#pragma once

#include "yankring/entry.hpp"
#include <vector>

namespace yankring {

// Durable append-only history log. SqliteEntryStore is the real backend;
// tests substitute their own.
class IEntryStore {
public:
    virtual ~IEntryStore() = default;

    // Persists entry (id and size are assigned here) and prunes beyond retention.
    // Throws ValidationError, ContentionTimeout or StoreUnavailable.
    virtual HistoryEntry append(const HistoryEntry& entry) = 0;

    // Newest first, at most min(limit, maxEntries()). Empty on read failure.
    virtual std::vector<HistoryEntry> recent(size_t limit) const = 0;

    // Single aggregate query; {0, 0} when closed or on failure.
    virtual SyncStatus syncStatus() const = 0;

    virtual size_t maxEntries() const = 0;

    // Idempotent
    virtual void close() = 0;
};

// Checks shape and size of an entry about to be persisted; returns the byte size.
int64_t validate_for_append(const HistoryEntry& entry, int64_t max_content_size);

} // namespace yankring
