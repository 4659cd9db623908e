#pragma once

#include "IKeyValueStore.h"
#include <sqlite3.h>
#include <memory>
#include <mutex>
#include <string>

namespace Signet {

/**
 * @brief Key-value store persisted in a single SQLite table
 *
 * Schema: kv(key TEXT PRIMARY KEY, value BLOB NOT NULL). The connection is
 * opened in WAL mode and shared by all callers behind one mutex.
 */
class SqliteKeyValueStore : public IKeyValueStore {
public:
    /**
     * @brief Open (or create) the database
     * @param path Database file, or ":memory:"
     * @return StorageError if the database cannot be opened or migrated
     */
    static Result<std::unique_ptr<SqliteKeyValueStore>> open(const std::string& path);

    ~SqliteKeyValueStore() override;

    SqliteKeyValueStore(const SqliteKeyValueStore&) = delete;
    SqliteKeyValueStore& operator=(const SqliteKeyValueStore&) = delete;

    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<void> put(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    Result<std::vector<std::string>> list(const std::string& prefix) override;

    const std::string& path() const { return path_; }

private:
    SqliteKeyValueStore(sqlite3* db, std::string path);

    Error storageError(const std::string& what) const;

    sqlite3* db_;
    std::string path_;
    std::mutex mutex_;
};

} // namespace Signet
