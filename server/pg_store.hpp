#pragma once

// ============================================================
// pg_store.hpp -- Client-server catalog store (PostgreSQL, libpq)
// ============================================================

#include "catalog_store.hpp"
#include <string>

typedef struct pg_conn PGconn;

class PgStore : public CatalogStore {
public:
    // 'uri' is a libpq connection string or postgresql:// URI; login and
    // password, when set, override what it carries. Throws CatalogError.
    PgStore(const std::string& uri, const std::string& login, const std::string& password);
    ~PgStore() override;

    PgStore(const PgStore&) = delete;
    PgStore& operator=(const PgStore&) = delete;

    void exec(const std::string& sql) override;
    bool execute(const std::string& sql, const std::vector<std::string>& args) override;
    std::vector<SqlRow> query(const std::string& sql,
                              const std::vector<std::string>& args) override;
    bool dump(std::string& out) override;

private:
    PGconn* conn_{nullptr};
};
