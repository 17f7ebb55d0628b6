#pragma once

// ============================================================
// sql_dialect.hpp -- Per-engine SQL text for the file catalog
//
// The catalog builds every statement through a SqlDialect chosen when
// the catalog is constructed:
//   sqlite3       positional  "?"
//   postgres      numbered    "$1", "$2", ...
//   ora / oci8    named       ":dataset", ":block", ...
// ============================================================

#include "../common/records.hpp"
#include <string>
#include <vector>

enum class PlaceholderStyle {
    POSITIONAL,
    DOLLAR,
    NAMED,
};

class SqlDialect {
public:
    // Throws std::invalid_argument for an unknown catalog type
    static SqlDialect for_type(const std::string& db_type, const std::string& owner = "");

    const std::string& name() const { return name_; }
    PlaceholderStyle   style() const { return style_; }

    // Placeholder for the index-th (1-based) parameter named 'param'
    std::string placeholder(const std::string& param, int index) const;

    // Table name qualified by the schema owner when one is configured
    std::string table(const std::string& name) const;

    // INSERT that silently skips rows violating a uniqueness constraint.
    // Engines without such a form get a plain INSERT; their store reports
    // the violation as a conflict instead.
    std::string insert_ignore(const std::string& table_name,
                              const std::vector<std::string>& columns) const;

    // Statement opening a write transaction ("" when implicit)
    std::string begin_statement() const;

    // CREATE statements for datasets, blocks and files
    std::vector<std::string> schema() const;

private:
    SqlDialect(std::string name, PlaceholderStyle style, std::string owner)
        : name_(std::move(name)), style_(style), owner_(std::move(owner)) {}

    std::string      name_;
    PlaceholderStyle style_;
    std::string      owner_;
};

// A statement and its bound values, in placeholder order
struct SqlStatement {
    std::string              text;
    std::vector<std::string> args;
};

// Query over files joined to blocks and datasets with one equality
// predicate per non-empty filter field. Columns come back as
// lfn, pfn, dataset, block, bytes, hash.
SqlStatement build_records_query(const SqlDialect& dialect, const TransferRequest& filter);
