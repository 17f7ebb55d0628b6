// ============================================================
// pg_store.cpp
// ============================================================

#include "pg_store.hpp"
#include "../common/logger.hpp"
#include <memory>
#include <cstdlib>
#include <cstring>

#include <libpq-fe.h>

namespace {

// SQLSTATE unique_violation
static constexpr const char* PG_UNIQUE_VIOLATION = "23505";

using PgResult = std::unique_ptr<PGresult, decltype(&PQclear)>;

PgResult run(PGconn* conn, const std::string& sql, const std::vector<std::string>& args) {
    std::vector<const char*> values;
    values.reserve(args.size());
    for (auto& a : args) values.push_back(a.c_str());
    return PgResult(PQexecParams(conn, sql.c_str(), (int)values.size(), nullptr,
                                 values.empty() ? nullptr : values.data(),
                                 nullptr, nullptr, 0),
                    &PQclear);
}

std::string error_text(PGconn* conn, const PGresult* res) {
    const char* msg = res ? PQresultErrorMessage(res) : nullptr;
    std::string out = (msg && *msg) ? msg : PQerrorMessage(conn);
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) out.pop_back();
    return out;
}

} // namespace

PgStore::PgStore(const std::string& uri, const std::string& login, const std::string& password) {
    std::vector<const char*> keys{"dbname"};
    std::vector<const char*> vals{uri.c_str()};
    if (!login.empty())    { keys.push_back("user");     vals.push_back(login.c_str()); }
    if (!password.empty()) { keys.push_back("password"); vals.push_back(password.c_str()); }
    keys.push_back(nullptr);
    vals.push_back(nullptr);

    // expand_dbname = 1: 'dbname' may itself be a full connection string
    conn_ = PQconnectdbParams(keys.data(), vals.data(), 1);
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        std::string err = conn_ ? PQerrorMessage(conn_) : "out of memory";
        if (conn_) { PQfinish(conn_); conn_ = nullptr; }
        throw CatalogError("Cannot connect to PostgreSQL catalog: " + err);
    }
    LOG_DEBUG(std::string("Connected to PostgreSQL catalog on ") + PQhost(conn_));
}

PgStore::~PgStore() {
    if (conn_) PQfinish(conn_);
}

void PgStore::exec(const std::string& sql) {
    PgResult res(PQexec(conn_, sql.c_str()), &PQclear);
    auto st = res ? PQresultStatus(res.get()) : PGRES_FATAL_ERROR;
    if (st != PGRES_COMMAND_OK && st != PGRES_TUPLES_OK) {
        throw CatalogError("'" + sql + "' failed: " + error_text(conn_, res.get()));
    }
}

bool PgStore::execute(const std::string& sql, const std::vector<std::string>& args) {
    PgResult res = run(conn_, sql, args);
    auto st = res ? PQresultStatus(res.get()) : PGRES_FATAL_ERROR;
    if (st == PGRES_COMMAND_OK || st == PGRES_TUPLES_OK) {
        return std::atoi(PQcmdTuples(res.get())) > 0;
    }

    const char* state = res ? PQresultErrorField(res.get(), PG_DIAG_SQLSTATE) : nullptr;
    if (state && std::strcmp(state, PG_UNIQUE_VIOLATION) == 0) return false;
    throw CatalogError("'" + sql + "' failed: " + error_text(conn_, res.get()));
}

std::vector<SqlRow> PgStore::query(const std::string& sql, const std::vector<std::string>& args) {
    PgResult res = run(conn_, sql, args);
    if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        throw CatalogError("'" + sql + "' failed: " + error_text(conn_, res.get()));
    }

    int nrows = PQntuples(res.get());
    int ncols = PQnfields(res.get());
    std::vector<SqlRow> rows;
    rows.reserve((size_t)nrows);
    for (int r = 0; r < nrows; ++r) {
        SqlRow row;
        row.reserve((size_t)ncols);
        for (int c = 0; c < ncols; ++c) {
            row.push_back(PQgetisnull(res.get(), r, c) ? "" : PQgetvalue(res.get(), r, c));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

// pg_dump is a separate program; nothing equivalent exists over libpq
bool PgStore::dump(std::string& out) {
    out.clear();
    return false;
}
