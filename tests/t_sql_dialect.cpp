// ============================================================
// t_sql_dialect.cpp
// ============================================================

#include <gtest/gtest.h>

#include "../server/sql_dialect.hpp"
#include <stdexcept>

TEST(T_SqlDialect, ForType) {
    EXPECT_EQ("sqlite3",  SqlDialect::for_type("sqlite3").name());
    EXPECT_EQ("sqlite3",  SqlDialect::for_type("SQLite").name());
    EXPECT_EQ("postgres", SqlDialect::for_type("postgresql").name());
    EXPECT_EQ("ora",      SqlDialect::for_type("oci8").name());
    EXPECT_EQ(PlaceholderStyle::NAMED, SqlDialect::for_type("ora").style());
    EXPECT_THROW(SqlDialect::for_type("mysql"), std::invalid_argument);
    EXPECT_THROW(SqlDialect::for_type(""), std::invalid_argument);
}

TEST(T_SqlDialect, Placeholders) {
    SqlDialect lite = SqlDialect::for_type("sqlite3");
    SqlDialect pg   = SqlDialect::for_type("postgres");
    SqlDialect ora  = SqlDialect::for_type("ora");

    EXPECT_EQ("?",        lite.placeholder("dataset", 1));
    EXPECT_EQ("?",        lite.placeholder("block", 2));
    EXPECT_EQ("$1",       pg.placeholder("dataset", 1));
    EXPECT_EQ("$3",       pg.placeholder("lfn", 3));
    EXPECT_EQ(":dataset", ora.placeholder("dataset", 1));
    EXPECT_EQ(":lfn",     ora.placeholder("lfn", 3));
}

TEST(T_SqlDialect, InsertIgnore) {
    EXPECT_EQ("INSERT OR IGNORE INTO datasets (dataset) VALUES (?)",
              SqlDialect::for_type("sqlite3").insert_ignore("datasets", {"dataset"}));
    EXPECT_EQ("INSERT INTO blocks (block) VALUES ($1) ON CONFLICT DO NOTHING",
              SqlDialect::for_type("postgres").insert_ignore("blocks", {"block"}));
    EXPECT_EQ("INSERT INTO CMS.files (lfn, pfn) VALUES (:lfn, :pfn)",
              SqlDialect::for_type("ora", "CMS").insert_ignore("files", {"lfn", "pfn"}));
}

TEST(T_SqlDialect, OwnerQualifiesTables) {
    SqlDialect ora = SqlDialect::for_type("ora", "CMS");
    EXPECT_EQ("CMS.files", ora.table("files"));
    EXPECT_EQ("files", SqlDialect::for_type("sqlite3", "ignored").table("files"));
    for (auto& stmt : ora.schema()) {
        EXPECT_NE(std::string::npos, stmt.find("CMS.")) << stmt;
    }
}

TEST(T_SqlDialect, SchemaHasFileUniqueness) {
    auto schema = SqlDialect::for_type("sqlite3").schema();
    ASSERT_EQ(3u, schema.size());
    EXPECT_NE(std::string::npos, schema[2].find("UNIQUE (lfn, blockid, datasetid)"));
}

TEST(T_SqlDialect, RecordsQueryWithoutFilter) {
    SqlStatement st = build_records_query(SqlDialect::for_type("sqlite3"), TransferRequest{});
    EXPECT_TRUE(st.args.empty());
    EXPECT_EQ(std::string::npos, st.text.find("WHERE"));
    EXPECT_NE(std::string::npos, st.text.find("ORDER BY F.id"));
}

TEST(T_SqlDialect, RecordsQueryFilterSubsets) {
    TransferRequest f;
    f.block = "/a/b/c#1";
    f.file  = "/store/x.root";

    SqlStatement pg = build_records_query(SqlDialect::for_type("postgres"), f);
    ASSERT_EQ(2u, pg.args.size());
    EXPECT_EQ("/a/b/c#1", pg.args[0]);
    EXPECT_EQ("/store/x.root", pg.args[1]);
    EXPECT_NE(std::string::npos, pg.text.find("WHERE B.block = $1 AND F.lfn = $2"));

    SqlStatement ora = build_records_query(SqlDialect::for_type("ora"), f);
    EXPECT_NE(std::string::npos, ora.text.find("WHERE B.block = :block AND F.lfn = :lfn"));

    f.dataset = "/a/b/c";
    SqlStatement lite = build_records_query(SqlDialect::for_type("sqlite3"), f);
    ASSERT_EQ(3u, lite.args.size());
    EXPECT_EQ("/a/b/c", lite.args[0]);
    EXPECT_NE(std::string::npos,
              lite.text.find("WHERE D.dataset = ? AND B.block = ? AND F.lfn = ?"));
}
