#pragma once

#include "yankring/log.hpp"
#include "yankring/store.hpp"
#include <sqlite3.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace yankring {

struct StoreOptions {
    size_t maxEntries {100};
    int64_t maxContentSize {1048576};
    std::chrono::milliseconds lockTimeout {5000};
};

class SqliteEntryStore : public IEntryStore {
public:
    static constexpr const char* kFileName = "history.db";
    static constexpr int kSchemaVersion = 1;

    // Opens <data_dir>/history.db, creating the directory when needed.
    // A damaged database file is moved aside (or deleted) and replaced by a fresh one.
    static std::unique_ptr<SqliteEntryStore> open(const std::string& data_dir,
                                                  const StoreOptions& opts,
                                                  const Logger& log);

    // Renames a damaged database to backup_path, deleting it when the rename
    // fails, and drops its -wal/-shm files. False when neither worked.
    static bool quarantine(const std::string& db_path, const std::string& backup_path, const Logger& log);

    // Opens db_path as is. Throws StoreUnavailable.
    SqliteEntryStore(const std::string& db_path, const StoreOptions& opts, const Logger& log);
    ~SqliteEntryStore() override;

    SqliteEntryStore(const SqliteEntryStore&) = delete;
    SqliteEntryStore& operator=(const SqliteEntryStore&) = delete;

    HistoryEntry append(const HistoryEntry& entry) override;
    std::vector<HistoryEntry> recent(size_t limit) const override;
    SyncStatus syncStatus() const override;
    size_t maxEntries() const override { return opts_.maxEntries; }
    void close() override;

    // Utilities
    const std::string& dbPath() const { return db_path_; }
    bool isOpen() const;
    std::optional<std::string> setting(const std::string& key) const;
    // journal mode actually in effect ("wal" or "delete")
    std::string journalMode() const;

private:
    void openConnection();
    void applyPragmas();
    void createSchema();
    void prepareStatements();
    void finalizeStatements();
    void beginWrite();
    void prune();
    std::string queryJournalMode() const;

    std::string db_path_;
    StoreOptions opts_;
    const Logger& log_;
    sqlite3* db_ {nullptr};
    sqlite3_stmt* insert_ {nullptr};
    sqlite3_stmt* select_recent_ {nullptr};
    sqlite3_stmt* delete_old_ {nullptr};
    sqlite3_stmt* sync_status_ {nullptr};
    mutable std::mutex mutex_;
};

} // namespace yankring
