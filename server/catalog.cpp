// ============================================================
// catalog.cpp
// ============================================================

#include "catalog.hpp"
#include "sqlite_store.hpp"
#include "pg_store.hpp"
#include "../common/errors.hpp"
#include "../common/json_codec.hpp"
#include "../common/logger.hpp"
#include "../common/hash.hpp"
#include <fstream>
#include <sstream>

// ============================================================
// CatalogConfig
// ============================================================

CatalogConfig CatalogConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigError("Unable to read catalog file " + path);
    }
    std::stringstream ss;
    ss << f.rdbuf();

    Json::Value v;
    try {
        v = json_codec::parse(ss.str());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Unable to parse catalog file " + path + ": " + e.what());
    }
    if (!v.isObject()) {
        throw ConfigError("Catalog file " + path + " must hold a JSON object");
    }

    CatalogConfig cfg;
    cfg.type     = v.get("type", "").asString();
    cfg.uri      = v.get("uri", "").asString();
    cfg.login    = v.get("login", "").asString();
    cfg.password = v.get("password", "").asString();
    cfg.owner    = v.get("owner", "").asString();
    if (cfg.type.empty() || cfg.uri.empty()) {
        throw ConfigError("Catalog file " + path + " needs both 'type' and 'uri'");
    }
    return cfg;
}

// ============================================================
// Catalog
// ============================================================

static std::unique_ptr<CatalogStore> open_store(const SqlDialect& dialect, const CatalogConfig& cfg) {
    if (dialect.style() == PlaceholderStyle::POSITIONAL) {
        return std::make_unique<SqliteStore>(cfg.uri);
    }
    if (dialect.style() == PlaceholderStyle::DOLLAR) {
        return std::make_unique<PgStore>(cfg.uri, cfg.login, cfg.password);
    }
    throw CatalogError("No database backend for catalog type '" + cfg.type + "'");
}

static SqlDialect dialect_for(const CatalogConfig& cfg) {
    try {
        return SqlDialect::for_type(cfg.type, cfg.owner);
    } catch (const std::invalid_argument& e) {
        throw CatalogError(e.what());
    }
}

Catalog::Catalog(const CatalogConfig& cfg)
    : dialect_(dialect_for(cfg)),
      store_(open_store(dialect_, cfg)),
      type_(cfg.type)
{
    create_schema();
    LOG_INFO("Catalog " + cfg.to_string() + " ready (" + dialect_.name() + " dialect)");
}

Catalog::Catalog(SqlDialect dialect, std::unique_ptr<CatalogStore> store, std::string type)
    : dialect_(std::move(dialect)),
      store_(std::move(store)),
      type_(type.empty() ? dialect_.name() : std::move(type))
{
    create_schema();
}

void Catalog::create_schema() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& stmt : dialect_.schema()) {
        store_->exec(stmt);
    }
}

std::string Catalog::ensure_id(const std::string& table, const std::string& column,
                               const std::string& value)
{
    // A conflict only means another writer created the row first
    if (!store_->execute(dialect_.insert_ignore(table, {column}), {value})) {
        LOG_DEBUG(table + " '" + value + "' already present");
    }

    auto rows = store_->query("SELECT id FROM " + dialect_.table(table) +
                              " WHERE " + column + " = " + dialect_.placeholder(column, 1),
                              {value});
    if (rows.empty() || rows[0].empty() || rows[0][0].empty()) {
        throw CatalogError("No id for " + column + " '" + value + "' after insert");
    }
    return rows[0][0];
}

void Catalog::begin() {
    std::string stmt = dialect_.begin_statement();
    if (!stmt.empty()) store_->exec(stmt);
}

void Catalog::rollback() {
    try {
        store_->exec("ROLLBACK");
    } catch (const CatalogError& rb) {
        LOG_ERROR("Catalog rollback failed: " + std::string(rb.what()));
    }
}

void Catalog::add(const CatalogEntry& e) {
    if (e.lfn.empty() || e.dataset.empty() || e.block.empty()) {
        throw CatalogError("Catalog entry needs lfn, dataset and block: " + e.to_string());
    }

    std::lock_guard<std::mutex> lk(mutex_);
    begin();

    try {
        std::string dataset_id = ensure_id("datasets", "dataset", e.dataset);
        std::string block_id   = ensure_id("blocks",   "block",   e.block);

        bool inserted = store_->execute(
            dialect_.insert_ignore("files", {"lfn", "pfn", "blockid", "datasetid", "bytes", "hash"}),
            {e.lfn, e.pfn, block_id, dataset_id, std::to_string(e.bytes), e.hash});
        if (!inserted) {
            LOG_DEBUG("File already cataloged: " + e.lfn);
        }
        store_->exec("COMMIT");
    } catch (const std::exception& ex) {
        rollback();
        throw CatalogError("Catalog add of " + e.lfn + " failed: " + ex.what());
    }
    LOG_DEBUG("Cataloged " + e.to_string());
}

// ---------------------------------------------------------------
// commit_file
//   The row is inserted before the file is moved: a concurrent commit
//   of the same name either waits on the write lock (sqlite) or on the
//   uncommitted unique key (postgres) and then sees the row, so the
//   file of a cataloged pfn is never replaced.
// ---------------------------------------------------------------
CommitResult Catalog::commit_file(const CatalogEntry& e, const std::function<void()>& store_file) {
    if (e.lfn.empty() || e.dataset.empty() || e.block.empty() || e.pfn.empty()) {
        throw CatalogError("Catalog entry needs lfn, pfn, dataset and block: " + e.to_string());
    }

    std::lock_guard<std::mutex> lk(mutex_);
    begin();

    CommitResult result = CommitResult::ADDED;
    std::string existing;
    try {
        std::string dataset_id = ensure_id("datasets", "dataset", e.dataset);
        std::string block_id   = ensure_id("blocks",   "block",   e.block);

        bool inserted = store_->execute(
            dialect_.insert_ignore("files", {"lfn", "pfn", "blockid", "datasetid", "bytes", "hash"}),
            {e.lfn, e.pfn, block_id, dataset_id, std::to_string(e.bytes), e.hash});

        if (inserted) {
            store_file();
        } else {
            auto rows = store_->query(
                "SELECT hash FROM " + dialect_.table("files") +
                " WHERE lfn = " + dialect_.placeholder("lfn", 1) +
                " AND blockid = " + dialect_.placeholder("blockid", 2) +
                " AND datasetid = " + dialect_.placeholder("datasetid", 3),
                {e.lfn, block_id, dataset_id});
            if (rows.empty() || rows[0].empty()) {
                throw CatalogError("File row for " + e.lfn + " rejected but not found");
            }
            existing = rows[0][0];
            result = hash::same_hash(existing, e.hash) ? CommitResult::PRESENT
                                                       : CommitResult::CONFLICT;
        }
        store_->exec("COMMIT");
    } catch (const CatalogError& ex) {
        rollback();
        throw CatalogError("Catalog commit of " + e.lfn + " failed: " + ex.what());
    } catch (const std::exception&) {
        rollback();
        throw;
    }

    if (result == CommitResult::ADDED) {
        LOG_DEBUG("Cataloged " + e.to_string());
    } else if (result == CommitResult::CONFLICT) {
        LOG_WARN("Not replacing " + e.lfn + " in " + e.block + ": cataloged with hash " +
                 existing + ", received " + e.hash);
    }
    return result;
}

bool Catalog::query(const TransferRequest& filter, std::vector<CatalogEntry>& out) {
    out.clear();
    SqlStatement st = build_records_query(dialect_, filter);

    std::vector<SqlRow> rows;
    try {
        std::lock_guard<std::mutex> lk(mutex_);
        rows = store_->query(st.text, st.args);
    } catch (const CatalogError& e) {
        LOG_ERROR("Catalog query " + filter.to_string() + " failed: " + e.what());
        return false;
    }

    out.reserve(rows.size());
    for (auto& r : rows) {
        if (r.size() < 6) continue;
        CatalogEntry e;
        e.lfn     = r[0];
        e.pfn     = r[1];
        e.dataset = r[2];
        e.block   = r[3];
        e.bytes   = r[4].empty() ? 0 : std::stoll(r[4]);
        e.hash    = r[5];
        out.push_back(std::move(e));
    }
    return true;
}

std::vector<CatalogEntry> Catalog::records(const TransferRequest& filter) {
    std::vector<CatalogEntry> out;
    if (!query(filter, out)) {
        LOG_WARN("Returning no catalog records after query failure");
    }
    return out;
}

std::vector<std::string> Catalog::files(const std::string& dataset,
                                        const std::string& block,
                                        const std::string& lfn)
{
    TransferRequest filter;
    filter.dataset = dataset;
    filter.block   = block;
    filter.file    = lfn;

    std::vector<std::string> out;
    for (auto& e : records(filter)) out.push_back(e.lfn);
    return out;
}

std::string Catalog::dump() {
    std::string out;
    try {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!store_->dump(out)) {
            LOG_WARN("Catalog dump is not supported for type " + type_);
            return "";
        }
    } catch (const CatalogError& e) {
        LOG_ERROR("Catalog dump failed: " + std::string(e.what()));
        return "";
    }
    return out;
}
