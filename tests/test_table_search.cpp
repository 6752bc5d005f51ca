#include <gtest/gtest.h>
#include "search/table_search.hpp"
#include "core/logger.hpp"
#include "fake_session.hpp"

using namespace sqlbridge;
using config::Driver;
using query::DbManager;
using search::TableSearch;

class TableSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_console_enabled(false);
        state = std::make_shared<test::FakeSessionState>();
    }

    void TearDown() override {
        core::Logger::instance().set_console_enabled(true);
    }

    std::unique_ptr<DbManager> make_manager(Driver driver) {
        return std::make_unique<DbManager>(test::make_config(driver, "dr_"), test::make_fake(state));
    }

    void script_mysql_site() {
        state->on("SHOW TABLES", test::raw_result(
            {{"Tables_in_site", SQL_VARCHAR}}, {{"dr_users"}, {"dr_node"}}));
        state->on("DESCRIBE `dr_node`", test::raw_result(
            {{"Field", SQL_VARCHAR}, {"Type", SQL_VARCHAR}},
            {{"nid", "int(10) unsigned"}, {"title", "varchar(255)"}, {"body", "longtext"}}));
        state->on("DESCRIBE `dr_users`", test::raw_result(
            {{"Field", SQL_VARCHAR}, {"Type", SQL_VARCHAR}},
            {{"uid", "int(10)"}, {"name", "varchar(60)"}}));
    }

    std::shared_ptr<test::FakeSessionState> state;
};

TEST_F(TableSearchTest, FindsMatchingColumnWithinRowLimit) {
    auto db = make_manager(Driver::MYSQL);
    script_mysql_site();
    state->on("LOWER(`title`)", test::raw_result(
        {{"nid", SQL_INTEGER}, {"title", SQL_VARCHAR}, {"body", SQL_LONGVARCHAR}},
        {{"1", "Hello world", "x"}, {"2", "Say hello", "y"}}));
    state->on("LOWER(`body`)", test::raw_result(
        {{"nid", SQL_INTEGER}, {"title", SQL_VARCHAR}, {"body", SQL_LONGVARCHAR}}, {}));
    state->on("LOWER(`name`)", test::raw_result(
        {{"uid", SQL_INTEGER}, {"name", SQL_VARCHAR}}, {}));

    auto findings = TableSearch(*db).search_all_tables("hello", 5);

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].table_name, "node");
    EXPECT_EQ(findings[0].column_name, "title");
    ASSERT_EQ(findings[0].matching_rows.size(), 2u);
    EXPECT_EQ(findings[0].matching_rows[0].at("nid").as_integer(), 1);

    // One statement per text-like column, none for integer columns
    EXPECT_EQ(state->count_containing("LIKE LOWER(?)"), 3u);
    EXPECT_EQ(state->count_containing("`nid`"), 0u);
    EXPECT_EQ(state->count_containing("LIMIT 5"), 3u);
}

TEST_F(TableSearchTest, FailingColumnIsSkipped) {
    auto db = make_manager(Driver::MYSQL);
    script_mysql_site();
    state->fail_on("LOWER(`title`)", test::odbc_error("HY000", "Illegal mix of collations"));
    state->on("LOWER(`body`)", test::raw_result(
        {{"nid", SQL_INTEGER}, {"body", SQL_LONGVARCHAR}}, {{"3", "hello again"}}));
    state->on("LOWER(`name`)", test::raw_result(
        {{"uid", SQL_INTEGER}, {"name", SQL_VARCHAR}}, {{"9", "hello_user"}}));

    auto findings = TableSearch(*db).search_all_tables("hello", 10);

    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0].table_name, "node");
    EXPECT_EQ(findings[0].column_name, "body");
    EXPECT_EQ(findings[1].table_name, "users");
    EXPECT_EQ(findings[1].column_name, "name");
}

TEST_F(TableSearchTest, TableWithoutSchemaIsSkipped) {
    auto db = make_manager(Driver::MYSQL);
    state->on("SHOW TABLES", test::raw_result(
        {{"Tables_in_site", SQL_VARCHAR}}, {{"dr_broken"}, {"dr_users"}}));
    state->fail_on("DESCRIBE `dr_broken`", test::odbc_error("42S02", "Table doesn't exist"));
    state->on("DESCRIBE `dr_users`", test::raw_result(
        {{"Field", SQL_VARCHAR}, {"Type", SQL_VARCHAR}}, {{"name", "varchar(60)"}}));
    state->on("LOWER(`name`)", test::raw_result(
        {{"name", SQL_VARCHAR}}, {{"admin"}}));

    auto findings = TableSearch(*db).search_all_tables("adm", 1);

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].table_name, "users");
}

TEST_F(TableSearchTest, NeedleWildcardsAreEscaped) {
    auto db = make_manager(Driver::MYSQL);
    script_mysql_site();

    TableSearch(*db).search_all_tables("50%_off", 5);

    bool saw_search = false;
    for (const auto& stmt : state->executed) {
        if (stmt.sql.find("LIKE LOWER(?)") != std::string::npos) {
            saw_search = true;
            EXPECT_EQ(stmt.params, (std::vector<core::Value>{"%50!%!_off%"}));
        }
    }
    EXPECT_TRUE(saw_search);
}

TEST_F(TableSearchTest, NonPositiveLimitRunsNothing) {
    auto db = make_manager(Driver::MYSQL);
    script_mysql_site();

    EXPECT_TRUE(TableSearch(*db).search_all_tables("hello", 0).empty());
    EXPECT_TRUE(TableSearch(*db).search_all_tables("hello", -3).empty());
    EXPECT_TRUE(state->executed.empty());
}

TEST_F(TableSearchTest, TableListFailureGivesNoFindings) {
    auto db = make_manager(Driver::MYSQL);
    state->fail_on("SHOW TABLES", test::odbc_error("08S01", "Communication link failure"));

    EXPECT_TRUE(TableSearch(*db).search_all_tables("hello", 5).empty());
}

TEST_F(TableSearchTest, SqlServerBindsLimitThenPattern) {
    auto db = make_manager(Driver::MSSQL);
    state->on("INFORMATION_SCHEMA.TABLES", test::raw_result(
        {{"table_name", SQL_VARCHAR}}, {{"dr_node"}}));
    state->on("INFORMATION_SCHEMA.COLUMNS", test::raw_result(
        {{"column_name", SQL_VARCHAR}, {"data_type", SQL_VARCHAR}},
        {{"nid", "int"}, {"title", "nvarchar"}}));
    state->on("TOP (?)", test::raw_result(
        {{"nid", SQL_INTEGER}, {"title", SQL_WVARCHAR}}, {{"4", "Hello"}}));

    auto findings = TableSearch(*db).search_all_tables("hello", 2);

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].column_name, "title");
    const auto& last = state->executed.back();
    EXPECT_EQ(last.sql, "SELECT TOP (?) * FROM [dr_node] WHERE [title] LIKE ? ESCAPE '!'");
    EXPECT_EQ(last.params, (std::vector<core::Value>{2, "%hello%"}));
}
