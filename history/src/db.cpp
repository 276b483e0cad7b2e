#include "yankring/db.hpp"
#include "yankring/errors.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace yankring {

static void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown sqlite error";
        sqlite3_free(err);
        throw StoreUnavailable(msg, sqlite3_extended_errcode(db));
    }
}

static bool is_corruption(int code) {
    const int primary = code & 0xff;
    return primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB || primary == SQLITE_IOERR;
}

static bool is_busy(int code) {
    const int primary = code & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

static sqlite3_stmt* prepare_or_throw(sqlite3* db, const char* sql, const char* what) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StoreUnavailable(std::string("prepare failed for ") + what + ": " + sqlite3_errmsg(db),
                               sqlite3_extended_errcode(db));
    }
    return stmt;
}

static void bind_optional_text(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& v) {
    if (v) sqlite3_bind_text(stmt, idx, v->c_str(), static_cast<int>(v->size()), SQLITE_TRANSIENT);
    else sqlite3_bind_null(stmt, idx);
}

static void bind_optional_int(sqlite3_stmt* stmt, int idx, const std::optional<int>& v) {
    if (v) sqlite3_bind_int(stmt, idx, *v);
    else sqlite3_bind_null(stmt, idx);
}

static std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const unsigned char* txt = sqlite3_column_text(stmt, col);
    return std::string(reinterpret_cast<const char*>(txt), static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

static std::optional<int> column_optional_int(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(stmt, col);
}

// Resets a cached statement when leaving scope
struct StatementScope {
    sqlite3_stmt* stmt;
    ~StatementScope() {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};

int64_t validate_for_append(const HistoryEntry& entry, int64_t max_content_size) {
    if (static_cast<uint8_t>(entry.kind) > static_cast<uint8_t>(EntryKind::Blockwise)) {
        throw ValidationError("invalid register type");
    }
    if (entry.timestamp <= 0) {
        throw ValidationError("timestamp must be a positive number");
    }
    if (entry.blockWidth && *entry.blockWidth < 0) {
        throw ValidationError("block width must be non-negative");
    }
    if (entry.sourceLine && *entry.sourceLine < 0) {
        throw ValidationError("source line must be non-negative");
    }
    const auto size = static_cast<int64_t>(entry.content.size());
    if (size > max_content_size) {
        std::ostringstream ss;
        ss << "content too large: " << size << " bytes (max: " << max_content_size << ")";
        throw ValidationError(ss.str());
    }
    return size;
}

bool SqliteEntryStore::quarantine(const std::string& db_path, const std::string& backup_path, const Logger& log) {
    std::error_code ec;
    fs::rename(db_path, backup_path, ec);
    if (ec) {
        log.error("store", "could not back up damaged database: " + ec.message());
        std::error_code rm_ec;
        fs::remove(db_path, rm_ec);
        if (rm_ec) {
            log.error("store", "could not delete damaged database: " + rm_ec.message());
            return false;
        }
        log.debug("store", "damaged database deleted: " + db_path);
    } else {
        log.debug("store", "damaged database backed up to: " + backup_path);
    }
    for (const char* suffix : {"-wal", "-shm"}) {
        const fs::path side = db_path + suffix;
        std::error_code side_ec;
        fs::remove(side, side_ec);
        if (side_ec) log.error("store", "could not remove " + side.string() + ": " + side_ec.message());
    }
    return true;
}

std::unique_ptr<SqliteEntryStore> SqliteEntryStore::open(const std::string& data_dir,
                                                         const StoreOptions& opts,
                                                         const Logger& log) {
    std::error_code ec;
    fs::create_directories(data_dir, ec);
    if (ec) {
        throw StoreUnavailable("cannot create data directory " + data_dir + ": " + ec.message());
    }
    const fs::path db_path = fs::path(data_dir) / kFileName;
    try {
        return std::make_unique<SqliteEntryStore>(db_path.string(), opts, log);
    } catch (const StoreUnavailable& e) {
        if (!is_corruption(e.sqliteCode())) throw;
        log.error("store", std::string("database appears to be corrupted: ") + e.what());
        const std::string backup = db_path.string() + ".corrupted." + std::to_string(now_ms());
        if (!quarantine(db_path.string(), backup, log)) throw;
    }
    return std::make_unique<SqliteEntryStore>(db_path.string(), opts, log);
}

SqliteEntryStore::SqliteEntryStore(const std::string& db_path, const StoreOptions& opts, const Logger& log)
    : db_path_(db_path), opts_(opts), log_(log) {
    try {
        openConnection();
        applyPragmas();
        createSchema();
        prepareStatements();
        prune();
    } catch (...) {
        finalizeStatements();
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    log_.debug("store", "opened " + db_path_ + " (journal " + journalMode() + ")");
}

SqliteEntryStore::~SqliteEntryStore() {
    close();
}

void SqliteEntryStore::openConnection() {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        const int code = db_ ? sqlite3_extended_errcode(db_) : SQLITE_CANTOPEN;
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        throw StoreUnavailable("failed to open sqlite database " + db_path_ + ": " + msg, code);
    }
    sqlite3_extended_result_codes(db_, 1);
}

void SqliteEntryStore::applyPragmas() {
    const auto timeout = std::to_string(opts_.lockTimeout.count());
    const std::string optimal =
        "PRAGMA journal_mode=WAL;"
        "PRAGMA synchronous=NORMAL;"
        "PRAGMA cache_size=-2000;"
        "PRAGMA temp_store=MEMORY;"
        "PRAGMA busy_timeout=" + timeout + ";"
        "PRAGMA wal_checkpoint(TRUNCATE);";
    try {
        exec_or_throw(db_, optimal.c_str());
        // the pragma reports the old mode instead of failing when it cannot switch
        const std::string mode = queryJournalMode();
        if (mode != "wal") throw StoreUnavailable("journal_mode stayed " + mode);
    } catch (const StoreUnavailable& e) {
        if (is_corruption(e.sqliteCode())) throw;
        log_.debug("store", std::string("failed to set optimal pragmas, using fallback: ") + e.what());
        const std::string fallback =
            "PRAGMA journal_mode=DELETE;"
            "PRAGMA synchronous=FULL;"
            "PRAGMA busy_timeout=" + timeout + ";";
        exec_or_throw(db_, fallback.c_str());
    }
}

void SqliteEntryStore::createSchema() {
    exec_or_throw(db_,
                  "CREATE TABLE IF NOT EXISTS yank_history ("
                  " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                  " content TEXT NOT NULL,"
                  " regtype TEXT NOT NULL,"
                  " blockwidth INTEGER,"
                  " timestamp INTEGER NOT NULL,"
                  " size INTEGER NOT NULL,"
                  " source_channel TEXT,"
                  " source_file TEXT,"
                  " source_line INTEGER,"
                  " source_filetype TEXT,"
                  " created_at INTEGER DEFAULT (CAST(strftime('%s','now') AS INTEGER) * 1000),"
                  " CHECK(regtype IN ('v', 'V', 'b'))"
                  ");"
                  "CREATE INDEX IF NOT EXISTS idx_timestamp ON yank_history(timestamp DESC);"
                  "CREATE TABLE IF NOT EXISTS settings ("
                  " key TEXT PRIMARY KEY,"
                  " value TEXT NOT NULL,"
                  " updated_at INTEGER DEFAULT (CAST(strftime('%s','now') AS INTEGER) * 1000)"
                  ");");

    const std::string seed = "INSERT OR IGNORE INTO settings(key, value) VALUES('schema_version', '" +
                             std::to_string(kSchemaVersion) + "');"
                             "INSERT OR REPLACE INTO settings(key, value) VALUES('max_history', '" +
                             std::to_string(opts_.maxEntries) + "');";
    exec_or_throw(db_, seed.c_str());
}

void SqliteEntryStore::prepareStatements() {
    insert_ = prepare_or_throw(db_,
                               "INSERT INTO yank_history"
                               " (content, regtype, blockwidth, timestamp, size,"
                               "  source_channel, source_file, source_line, source_filetype)"
                               " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
                               "insert entry");
    select_recent_ = prepare_or_throw(db_,
                                      "SELECT id, content, regtype, blockwidth, timestamp, size,"
                                      " source_channel, source_file, source_line, source_filetype"
                                      " FROM yank_history"
                                      " ORDER BY timestamp DESC, id DESC"
                                      " LIMIT ?",
                                      "select recent");
    delete_old_ = prepare_or_throw(db_,
                                   "DELETE FROM yank_history WHERE id NOT IN ("
                                   " SELECT id FROM yank_history"
                                   " ORDER BY timestamp DESC, id DESC"
                                   " LIMIT ?)",
                                   "delete old");
    sync_status_ = prepare_or_throw(db_,
                                    "SELECT COALESCE(MAX(timestamp), 0), COUNT(*) FROM yank_history",
                                    "sync status");
}

void SqliteEntryStore::finalizeStatements() {
    for (sqlite3_stmt** s : {&insert_, &select_recent_, &delete_old_, &sync_status_}) {
        if (*s) sqlite3_finalize(*s);
        *s = nullptr;
    }
}

void SqliteEntryStore::prune() {
    StatementScope scope {delete_old_};
    sqlite3_bind_int64(delete_old_, 1, static_cast<sqlite3_int64>(opts_.maxEntries));
    const int rc = sqlite3_step(delete_old_);
    if (rc != SQLITE_DONE) {
        throw StoreUnavailable(std::string("retention cleanup failed: ") + sqlite3_errmsg(db_),
                               sqlite3_extended_errcode(db_));
    }
}

void SqliteEntryStore::beginWrite() {
    BackoffPolicy policy;
    policy.deadline = opts_.lockTimeout;
    const bool acquired = retryWithBackoff(policy, [this] {
        char* err = nullptr;
        const int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, &err);
        std::string msg = err ? err : "";
        sqlite3_free(err);
        if (rc == SQLITE_OK) return true;
        if (is_busy(sqlite3_extended_errcode(db_))) {
            log_.debug("store", "write lock busy, retrying");
            return false;
        }
        throw StoreUnavailable("begin transaction failed: " + msg, sqlite3_extended_errcode(db_));
    });
    if (!acquired) {
        throw ContentionTimeout("write lock not acquired within " + std::to_string(opts_.lockTimeout.count()) +
                                " ms");
    }
}

HistoryEntry SqliteEntryStore::append(const HistoryEntry& entry) {
    const int64_t size = validate_for_append(entry, opts_.maxContentSize);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) throw StoreUnavailable("store is closed");

    beginWrite();
    HistoryEntry out = entry;
    try {
        {
            StatementScope scope {insert_};
            sqlite3_bind_text(insert_, 1, entry.content.c_str(), static_cast<int>(entry.content.size()),
                              SQLITE_TRANSIENT);
            sqlite3_bind_text(insert_, 2, kindCode(entry.kind), -1, SQLITE_STATIC);
            bind_optional_int(insert_, 3, entry.kind == EntryKind::Blockwise ? entry.blockWidth : std::nullopt);
            sqlite3_bind_int64(insert_, 4, entry.timestamp);
            sqlite3_bind_int64(insert_, 5, size);
            if (entry.sourceChannel.empty()) sqlite3_bind_null(insert_, 6);
            else sqlite3_bind_text(insert_, 6, entry.sourceChannel.c_str(), -1, SQLITE_TRANSIENT);
            bind_optional_text(insert_, 7, entry.sourceFile);
            bind_optional_int(insert_, 8, entry.sourceLine);
            bind_optional_text(insert_, 9, entry.sourceContentType);
            const int rc = sqlite3_step(insert_);
            if (rc != SQLITE_DONE) {
                const int code = sqlite3_extended_errcode(db_);
                const std::string msg = std::string("insert entry failed: ") + sqlite3_errmsg(db_);
                if ((code & 0xff) == SQLITE_CONSTRAINT) throw ValidationError(msg);
                throw StoreUnavailable(msg, code);
            }
        }
        out.id = sqlite3_last_insert_rowid(db_);
        out.size = size;
        if (out.kind != EntryKind::Blockwise) out.blockWidth.reset();
        prune();
        exec_or_throw(db_, "COMMIT");
    } catch (...) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            log_.error("store", std::string("rollback failed: ") + (err ? err : "unknown"));
        }
        sqlite3_free(err);
        throw;
    }
    log_.debug("store", "appended id=" + std::to_string(*out.id) + " size=" + std::to_string(size));
    return out;
}

std::vector<HistoryEntry> SqliteEntryStore::recent(size_t limit) const {
    std::vector<HistoryEntry> out;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return out;

    StatementScope scope {select_recent_};
    const size_t n = std::min(limit, opts_.maxEntries);
    sqlite3_bind_int64(select_recent_, 1, static_cast<sqlite3_int64>(n));
    int rc;
    while ((rc = sqlite3_step(select_recent_)) == SQLITE_ROW) {
        const unsigned char* regtype = sqlite3_column_text(select_recent_, 2);
        auto kind = kindFromCode(regtype ? reinterpret_cast<const char*>(regtype) : "");
        if (!kind) {
            log_.error("store", "skipping row with invalid register type");
            continue;
        }
        HistoryEntry e;
        e.id = sqlite3_column_int64(select_recent_, 0);
        e.content = column_optional_text(select_recent_, 1).value_or(std::string());
        e.kind = *kind;
        e.blockWidth = column_optional_int(select_recent_, 3);
        e.timestamp = sqlite3_column_int64(select_recent_, 4);
        e.size = sqlite3_column_int64(select_recent_, 5);
        e.sourceChannel = column_optional_text(select_recent_, 6).value_or(std::string());
        e.sourceFile = column_optional_text(select_recent_, 7);
        e.sourceLine = column_optional_int(select_recent_, 8);
        e.sourceContentType = column_optional_text(select_recent_, 9);
        out.emplace_back(std::move(e));
    }
    if (rc != SQLITE_DONE) {
        log_.error("store", std::string("failed to get recent entries: ") + sqlite3_errmsg(db_));
        return {};
    }
    return out;
}

SyncStatus SqliteEntryStore::syncStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return {};
    StatementScope scope {sync_status_};
    if (sqlite3_step(sync_status_) != SQLITE_ROW) {
        log_.error("store", std::string("failed to get sync status: ") + sqlite3_errmsg(db_));
        return {};
    }
    SyncStatus s;
    s.lastTimestamp = sqlite3_column_int64(sync_status_, 0);
    s.entryCount = sqlite3_column_int64(sync_status_, 1);
    return s;
}

void SqliteEntryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return;
    finalizeStatements();
    if (sqlite3_close(db_) != SQLITE_OK) {
        log_.error("store", std::string("failed to close database: ") + sqlite3_errmsg(db_));
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
    log_.debug("store", "closed " + db_path_);
}

bool SqliteEntryStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::optional<std::string> SqliteEntryStore::setting(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return std::nullopt;
    sqlite3_stmt* stmt = prepare_or_throw(db_, "SELECT value FROM settings WHERE key = ?", "select setting");
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) value = column_optional_text(stmt, 0);
    sqlite3_finalize(stmt);
    return value;
}

std::string SqliteEntryStore::journalMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return {};
    return queryJournalMode();
}

std::string SqliteEntryStore::queryJournalMode() const {
    sqlite3_stmt* stmt = prepare_or_throw(db_, "PRAGMA journal_mode", "journal mode");
    std::string mode;
    if (sqlite3_step(stmt) == SQLITE_ROW) mode = column_optional_text(stmt, 0).value_or(std::string());
    sqlite3_finalize(stmt);
    return mode;
}

} // namespace yankring
