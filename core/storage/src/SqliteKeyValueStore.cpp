#include "SqliteKeyValueStore.h"
#include "Logger.h"

namespace Signet {

namespace {

const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS kv ("
    "  key TEXT PRIMARY KEY,"
    "  value BLOB NOT NULL"
    ");";

// Finalizes the statement on every exit path
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool prepared() const { return rc_ == SQLITE_OK && stmt_; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

} // namespace

Result<std::unique_ptr<SqliteKeyValueStore>> SqliteKeyValueStore::open(const std::string& path) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        Logger::instance().log(LogLevel::ERROR, "Failed to open database " + path + ": " + msg, "SqliteStore");
        return Error{ErrorCode::StorageError, "unable to open database: " + msg};
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        // In-memory databases refuse WAL; the default journal is fine there
        Logger::instance().log(LogLevel::DEBUG, "WAL not enabled: " + std::string(errMsg ? errMsg : ""), "SqliteStore");
        if (errMsg) sqlite3_free(errMsg);
        errMsg = nullptr;
    }

    if (sqlite3_exec(db, SCHEMA_SQL, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown error";
        if (errMsg) sqlite3_free(errMsg);
        sqlite3_close(db);
        Logger::instance().log(LogLevel::ERROR, "Failed to create kv table: " + msg, "SqliteStore");
        return Error{ErrorCode::StorageError, "unable to initialise database: " + msg};
    }

    return std::unique_ptr<SqliteKeyValueStore>(new SqliteKeyValueStore(db, path));
}

SqliteKeyValueStore::SqliteKeyValueStore(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

SqliteKeyValueStore::~SqliteKeyValueStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Error SqliteKeyValueStore::storageError(const std::string& what) const {
    std::string msg = what + ": " + sqlite3_errmsg(db_);
    Logger::instance().log(LogLevel::ERROR, msg, "SqliteStore");
    return Error{ErrorCode::StorageError, msg};
}

Result<std::optional<std::string>> SqliteKeyValueStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT value FROM kv WHERE key = ?;");
    if (!stmt.prepared()) {
        return storageError("prepare get");
    }
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::optional<std::string>{};
    }
    if (rc != SQLITE_ROW) {
        return storageError("get " + key);
    }

    const void* blob = sqlite3_column_blob(stmt.get(), 0);
    int size = sqlite3_column_bytes(stmt.get(), 0);
    std::string value;
    if (blob && size > 0) {
        value.assign(static_cast<const char*>(blob), static_cast<size_t>(size));
    }
    return std::optional<std::string>{std::move(value)};
}

Result<void> SqliteKeyValueStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "INSERT INTO kv (key, value) VALUES (?, ?) "
                        "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
    if (!stmt.prepared()) {
        return storageError("prepare put");
    }
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt.get(), 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return storageError("put " + key);
    }
    return Ok();
}

Result<void> SqliteKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM kv WHERE key = ?;");
    if (!stmt.prepared()) {
        return storageError("prepare remove");
    }
    sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return storageError("remove " + key);
    }
    return Ok();
}

Result<std::vector<std::string>> SqliteKeyValueStore::list(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    // substr() comparison keeps LIKE wildcards in the prefix literal
    Statement stmt(db_, "SELECT key FROM kv WHERE substr(key, 1, ?) = ? ORDER BY key;");
    if (!stmt.prepared()) {
        return storageError("prepare list");
    }
    sqlite3_bind_int(stmt.get(), 1, static_cast<int>(prefix.size()));
    sqlite3_bind_text(stmt.get(), 2, prefix.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<std::string> keys;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        if (text) {
            keys.emplace_back(reinterpret_cast<const char*>(text));
        }
    }
    if (rc != SQLITE_DONE) {
        return storageError("list " + prefix);
    }
    return keys;
}

} // namespace Signet
