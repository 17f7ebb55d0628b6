#pragma once

// ============================================================
// catalog_store.hpp -- Database connection used by the file catalog
// ============================================================

#include <string>
#include <vector>
#include <stdexcept>

// Any catalog failure other than a benign uniqueness conflict
class CatalogError : public std::runtime_error {
public:
    explicit CatalogError(const std::string& msg) : std::runtime_error(msg) {}
};

using SqlRow = std::vector<std::string>;

// One open connection. Not thread-safe: the Catalog serializes access.
// Values are bound as text; NULL columns come back as "".
class CatalogStore {
public:
    virtual ~CatalogStore() = default;

    // Run a statement without parameters (DDL, BEGIN, COMMIT, ROLLBACK)
    virtual void exec(const std::string& sql) = 0;

    // Run a parameterised write. Returns false when no row was written:
    // the insert was ignored or rejected for violating a uniqueness
    // constraint.
    virtual bool execute(const std::string& sql, const std::vector<std::string>& args) = 0;

    virtual std::vector<SqlRow> query(const std::string& sql,
                                      const std::vector<std::string>& args) = 0;

    // Full textual export; false when the engine has none
    virtual bool dump(std::string& out) = 0;
};
