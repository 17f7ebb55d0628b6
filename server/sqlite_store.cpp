// ============================================================
// sqlite_store.cpp
// ============================================================

#include "sqlite_store.hpp"
#include "../common/logger.hpp"

#include <sqlite3.h>

namespace {

// Finalizes the statement when it goes out of scope
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw CatalogError("Failed to prepare '" + sql + "': " + sqlite3_errmsg(db));
        }
    }
    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            int rc = sqlite3_bind_text(stmt_, (int)i + 1, args[i].c_str(),
                                       (int)args[i].size(), SQLITE_TRANSIENT);
            if (rc != SQLITE_OK) {
                throw CatalogError("Failed to bind parameter " + std::to_string(i + 1) +
                                   ": " + sqlite3_errmsg(db_));
            }
        }
    }

    int step() { return sqlite3_step(stmt_); }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3*      db_;
    sqlite3_stmt* stmt_{nullptr};
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* txt = sqlite3_column_text(stmt, col);
    if (!txt) return "";
    return std::string(reinterpret_cast<const char*>(txt),
                       (size_t)sqlite3_column_bytes(stmt, col));
}

std::string sql_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

} // namespace

SqliteStore::SqliteStore(const std::string& path, int busy_timeout_ms)
    : path_(path)
{
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) { sqlite3_close(db_); db_ = nullptr; }
        throw CatalogError("Cannot open catalog " + path + ": " + err);
    }
    sqlite3_busy_timeout(db_, busy_timeout_ms);
    sqlite3_extended_result_codes(db_, 1);
    exec("PRAGMA foreign_keys = ON");
    LOG_DEBUG("Opened SQLite catalog " + path);
}

SqliteStore::~SqliteStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw CatalogError("'" + sql + "' failed: " + msg);
    }
}

bool SqliteStore::execute(const std::string& sql, const std::vector<std::string>& args) {
    Statement st(db_, sql);
    st.bind(args);
    int rc = st.step();
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) return sqlite3_changes(db_) > 0;
    if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) return false;
    throw CatalogError("'" + sql + "' failed: " + sqlite3_errmsg(db_));
}

std::vector<SqlRow> SqliteStore::query(const std::string& sql,
                                       const std::vector<std::string>& args)
{
    Statement st(db_, sql);
    st.bind(args);

    std::vector<SqlRow> rows;
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) {
        int ncol = sqlite3_column_count(st.get());
        SqlRow row;
        row.reserve((size_t)ncol);
        for (int c = 0; c < ncol; ++c) row.push_back(column_text(st.get(), c));
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        throw CatalogError("'" + sql + "' failed: " + sqlite3_errmsg(db_));
    }
    return rows;
}

bool SqliteStore::dump(std::string& out) {
    out = "PRAGMA foreign_keys=OFF;\nBEGIN TRANSACTION;\n";

    Statement tables(db_, "SELECT name, sql FROM sqlite_master "
                          "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY rowid");
    int rc;
    while ((rc = tables.step()) == SQLITE_ROW) {
        std::string name = column_text(tables.get(), 0);
        out += column_text(tables.get(), 1) + ";\n";

        Statement rows(db_, "SELECT * FROM \"" + name + "\"");
        int rrc;
        while ((rrc = rows.step()) == SQLITE_ROW) {
            std::string line = "INSERT INTO " + name + " VALUES(";
            int ncol = sqlite3_column_count(rows.get());
            for (int c = 0; c < ncol; ++c) {
                if (c) line += ",";
                switch (sqlite3_column_type(rows.get(), c)) {
                    case SQLITE_NULL:    line += "NULL"; break;
                    case SQLITE_INTEGER:
                    case SQLITE_FLOAT:   line += column_text(rows.get(), c); break;
                    default:             line += sql_quote(column_text(rows.get(), c)); break;
                }
            }
            out += line + ");\n";
        }
        if (rrc != SQLITE_DONE) {
            throw CatalogError("dump of table " + name + " failed: " + sqlite3_errmsg(db_));
        }
    }
    if (rc != SQLITE_DONE) {
        throw CatalogError(std::string("dump failed: ") + sqlite3_errmsg(db_));
    }
    out += "COMMIT;\n";
    return true;
}
