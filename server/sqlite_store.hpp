#pragma once

// ============================================================
// sqlite_store.hpp -- File-backed catalog store (SQLite 3)
// ============================================================

#include "catalog_store.hpp"
#include <string>

struct sqlite3;

class SqliteStore : public CatalogStore {
public:
    // Opens (creating if needed) the database file; throws CatalogError.
    // Concurrent writers on the same file wait up to busy_timeout_ms.
    explicit SqliteStore(const std::string& path, int busy_timeout_ms = 10000);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    void exec(const std::string& sql) override;
    bool execute(const std::string& sql, const std::vector<std::string>& args) override;
    std::vector<SqlRow> query(const std::string& sql,
                              const std::vector<std::string>& args) override;
    bool dump(std::string& out) override;

private:
    sqlite3*    db_{nullptr};
    std::string path_;
};
