// ============================================================
// sql_dialect.cpp
// ============================================================

#include "sql_dialect.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

SqlDialect SqlDialect::for_type(const std::string& db_type, const std::string& owner) {
    std::string t = utils::to_lower(db_type);
    if (t == "sqlite3" || t == "sqlite") {
        return SqlDialect("sqlite3", PlaceholderStyle::POSITIONAL, "");
    }
    if (t == "postgres" || t == "postgresql" || t == "pg") {
        return SqlDialect("postgres", PlaceholderStyle::DOLLAR, owner);
    }
    if (t == "ora" || t == "oci8" || t == "oracle") {
        return SqlDialect("ora", PlaceholderStyle::NAMED, owner);
    }
    throw std::invalid_argument("Unknown catalog type: '" + db_type + "'");
}

std::string SqlDialect::placeholder(const std::string& param, int index) const {
    switch (style_) {
        case PlaceholderStyle::POSITIONAL: return "?";
        case PlaceholderStyle::DOLLAR:     return "$" + std::to_string(index);
        case PlaceholderStyle::NAMED:      return ":" + param;
    }
    return "?";
}

std::string SqlDialect::table(const std::string& name) const {
    if (owner_.empty()) return name;
    return owner_ + "." + name;
}

std::string SqlDialect::insert_ignore(const std::string& table_name,
                                      const std::vector<std::string>& columns) const
{
    std::string cols, vals;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) { cols += ", "; vals += ", "; }
        cols += columns[i];
        vals += placeholder(columns[i], (int)i + 1);
    }
    std::string body = table(table_name) + " (" + cols + ") VALUES (" + vals + ")";

    switch (style_) {
        case PlaceholderStyle::POSITIONAL: return "INSERT OR IGNORE INTO " + body;
        case PlaceholderStyle::DOLLAR:     return "INSERT INTO " + body + " ON CONFLICT DO NOTHING";
        case PlaceholderStyle::NAMED:      return "INSERT INTO " + body;
    }
    return "INSERT INTO " + body;
}

std::string SqlDialect::begin_statement() const {
    switch (style_) {
        // Take the write lock up front so two writers on one file never
        // deadlock upgrading from a read lock
        case PlaceholderStyle::POSITIONAL: return "BEGIN IMMEDIATE";
        case PlaceholderStyle::DOLLAR:     return "BEGIN";
        case PlaceholderStyle::NAMED:      return "";
    }
    return "BEGIN";
}

std::vector<std::string> SqlDialect::schema() const {
    std::string id_col, text_col = "VARCHAR(700)", int_col = "BIGINT";
    std::string if_not_exists = "IF NOT EXISTS ";
    switch (style_) {
        case PlaceholderStyle::POSITIONAL:
            id_col = "INTEGER PRIMARY KEY AUTOINCREMENT";
            text_col = "TEXT";
            int_col  = "INTEGER";
            break;
        case PlaceholderStyle::DOLLAR:
            id_col = "BIGSERIAL PRIMARY KEY";
            break;
        case PlaceholderStyle::NAMED:
            id_col = "NUMBER GENERATED BY DEFAULT AS IDENTITY PRIMARY KEY";
            text_col = "VARCHAR2(700)";
            int_col  = "NUMBER(19)";
            if_not_exists.clear();
            break;
    }

    std::vector<std::string> out;
    out.push_back("CREATE TABLE " + if_not_exists + table("datasets") + " ("
                  "id " + id_col + ", "
                  "dataset " + text_col + " NOT NULL UNIQUE)");
    out.push_back("CREATE TABLE " + if_not_exists + table("blocks") + " ("
                  "id " + id_col + ", "
                  "block " + text_col + " NOT NULL UNIQUE)");
    out.push_back("CREATE TABLE " + if_not_exists + table("files") + " ("
                  "id " + id_col + ", "
                  "lfn " + text_col + " NOT NULL, "
                  "pfn " + text_col + " NOT NULL, "
                  "blockid " + int_col + " REFERENCES " + table("blocks") + "(id), "
                  "datasetid " + int_col + " REFERENCES " + table("datasets") + "(id), "
                  "bytes " + int_col + ", "
                  "hash " + text_col + ", "
                  "UNIQUE (lfn, blockid, datasetid))");
    return out;
}

SqlStatement build_records_query(const SqlDialect& dialect, const TransferRequest& filter) {
    SqlStatement st;
    st.text = "SELECT F.lfn, F.pfn, D.dataset, B.block, F.bytes, F.hash"
              " FROM " + dialect.table("files") + " F"
              " JOIN " + dialect.table("blocks") + " B ON F.blockid = B.id"
              " JOIN " + dialect.table("datasets") + " D ON F.datasetid = D.id";

    std::vector<std::string> conds;
    auto add_cond = [&](const std::string& column, const std::string& param,
                        const std::string& value) {
        if (value.empty()) return;
        st.args.push_back(value);
        conds.push_back(column + " = " + dialect.placeholder(param, (int)st.args.size()));
    };
    add_cond("D.dataset", "dataset", filter.dataset);
    add_cond("B.block",   "block",   filter.block);
    add_cond("F.lfn",     "lfn",     filter.file);

    for (size_t i = 0; i < conds.size(); ++i) {
        st.text += (i == 0 ? " WHERE " : " AND ") + conds[i];
    }
    st.text += " ORDER BY F.id";
    return st;
}
