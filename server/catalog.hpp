#pragma once

// ============================================================
// catalog.hpp -- Trivial File Catalog: dataset -> block -> file
//
// Every add() runs as one transaction:
//   insert-or-ignore dataset, look up its id,
//   insert-or-ignore block,   look up its id,
//   insert-or-ignore file keyed by (lfn, blockid, datasetid).
// Uniqueness constraints, not existence checks, keep concurrent
// writers from creating duplicates.
// ============================================================

#include "../common/records.hpp"
#include "catalog_store.hpp"
#include "sql_dialect.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>

// Outcome of Catalog::commit_file
enum class CommitResult {
    ADDED,      // file moved into place and cataloged
    PRESENT,    // already cataloged with the same hash
    CONFLICT,   // already cataloged with another hash; nothing changed
};

struct CatalogConfig {
    std::string type;      // sqlite3, postgres, ora
    std::string uri;       // file path or connection string
    std::string login;
    std::string password;
    std::string owner;     // schema owner (ORACLE)

    // Read {type, uri, login, password, owner} from a JSON file.
    // Throws ConfigError.
    static CatalogConfig load(const std::string& path);

    std::string to_string() const {
        return "<Catalog: type=" + type + " uri=" + uri + ">";
    }
};

class Catalog {
public:
    // Open the configured engine and create the schema if absent.
    // Throws CatalogError (engine unreachable, unsupported type).
    explicit Catalog(const CatalogConfig& cfg);

    // Use an already open store; the schema is created as above
    Catalog(SqlDialect dialect, std::unique_ptr<CatalogStore> store, std::string type = "");

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    // Insert entry with its dataset and block. Re-adding a cataloged
    // file is a no-op. Throws CatalogError on any other failure.
    void add(const CatalogEntry& entry);

    // Catalog a received file. Within one transaction the (lfn, block,
    // dataset) row is claimed, then store_file() moves the content to
    // entry.pfn. When the row already exists store_file() is not called.
    // A store_file() exception rolls back and propagates unchanged;
    // engine failures throw CatalogError.
    CommitResult commit_file(const CatalogEntry& entry, const std::function<void()>& store_file);

    // Entries matching every non-empty field of filter (dataset, block,
    // file). Returns false if the engine failed; out is then empty.
    bool query(const TransferRequest& filter, std::vector<CatalogEntry>& out);

    // As query(), but a failure is logged and yields no entries
    std::vector<CatalogEntry> records(const TransferRequest& filter);

    // Logical names of the matching entries
    std::vector<std::string> files(const std::string& dataset,
                                   const std::string& block,
                                   const std::string& lfn);

    // Engine-specific export; empty when unsupported or on failure
    std::string dump();

    const std::string& type() const { return type_; }
    const SqlDialect&  dialect() const { return dialect_; }

private:
    SqlDialect                    dialect_;
    std::unique_ptr<CatalogStore> store_;
    std::string                   type_;
    std::mutex                    mutex_;

    void create_schema();
    void begin();
    void rollback();

    // Insert-or-ignore the name into table.column, return its id
    std::string ensure_id(const std::string& table, const std::string& column,
                          const std::string& value);
};
