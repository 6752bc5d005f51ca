#include <gtest/gtest.h>
#include "schema/schema_introspector.hpp"
#include "core/logger.hpp"
#include "fake_session.hpp"

using namespace sqlbridge;
using config::Driver;
using query::DbManager;
using schema::SchemaIntrospector;

class SchemaIntrospectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::instance().set_console_enabled(false);
        state = std::make_shared<test::FakeSessionState>();
    }

    void TearDown() override {
        core::Logger::instance().set_console_enabled(true);
    }

    std::unique_ptr<DbManager> make_manager(Driver driver, const std::string& prefix = "dr_") {
        return std::make_unique<DbManager>(test::make_config(driver, prefix), test::make_fake(state));
    }

    std::shared_ptr<test::FakeSessionState> state;
};

TEST_F(SchemaIntrospectorTest, MySqlListTablesUsesFirstColumnAndStripsPrefix) {
    auto db = make_manager(Driver::MYSQL);
    state->on("SHOW TABLES", test::raw_result(
        {{"Tables_in_site", SQL_VARCHAR}},
        {{"dr_users"}, {"dr_node"}, {"other_table"}, {"dr_"}}));

    SchemaIntrospector introspector(*db);
    auto tables = introspector.list_tables();

    ASSERT_TRUE(tables.has_value());
    EXPECT_EQ(*tables, (std::vector<std::string>{"node", "users"}));
}

TEST_F(SchemaIntrospectorTest, PostgresListTablesReadsTablename) {
    auto db = make_manager(Driver::PGSQL, "");
    state->on("pg_catalog.pg_tables", test::raw_result(
        {{"tablename", SQL_VARCHAR}},
        {{"node"}, {"block_content"}}));

    auto tables = SchemaIntrospector(*db).list_tables();

    ASSERT_TRUE(tables.has_value());
    EXPECT_EQ(*tables, (std::vector<std::string>{"block_content", "node"}));
}

TEST_F(SchemaIntrospectorTest, OracleListTablesFoldsNames) {
    auto db = make_manager(Driver::ORACLE, "dr_");
    state->on("user_tables", test::raw_result(
        {{"TABLE_NAME", SQL_VARCHAR}},
        {{"DR_NODE"}, {"DR_USERS"}, {"SYS_LOG"}}));

    auto tables = SchemaIntrospector(*db).list_tables();

    ASSERT_TRUE(tables.has_value());
    EXPECT_EQ(*tables, (std::vector<std::string>{"node", "users"}));
}

TEST_F(SchemaIntrospectorTest, ListTablesFailureIsNullopt) {
    auto db = make_manager(Driver::MSSQL);
    state->fail_on("INFORMATION_SCHEMA.TABLES", test::odbc_error("42000", "Permission denied"));

    EXPECT_FALSE(SchemaIntrospector(*db).list_tables().has_value());
}

TEST_F(SchemaIntrospectorTest, MySqlDescribe) {
    auto db = make_manager(Driver::MYSQL);
    state->on("DESCRIBE `dr_node`", test::raw_result(
        {{"Field", SQL_VARCHAR}, {"Type", SQL_VARCHAR}, {"Null", SQL_VARCHAR}},
        {{"nid", "int(10) unsigned", "NO"}, {"title", "varchar(255)", "YES"}}));

    auto schema = SchemaIntrospector(*db).get_table_schema("node");

    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ(schema->table, "node");
    ASSERT_EQ(schema->columns.size(), 2u);
    EXPECT_EQ(schema->columns[0].name, "nid");
    EXPECT_EQ(schema->columns[0].declared_type, "int(10) unsigned");
    EXPECT_TRUE(schema->has_column("title"));
    EXPECT_FALSE(schema->has_column("body"));
}

TEST_F(SchemaIntrospectorTest, MySqlUnsafeNameExecutesNothing) {
    auto db = make_manager(Driver::MYSQL);

    EXPECT_FALSE(SchemaIntrospector(*db).get_table_schema("node`; DROP TABLE x; --").has_value());
    EXPECT_TRUE(state->executed.empty());
}

TEST_F(SchemaIntrospectorTest, PostgresSchemaBindsPhysicalName) {
    auto db = make_manager(Driver::PGSQL);
    state->on("information_schema.columns", test::raw_result(
        {{"column_name", SQL_VARCHAR}, {"data_type", SQL_VARCHAR}},
        {{"nid", "integer"}, {"title", "character varying"}}));

    auto schema = SchemaIntrospector(*db).get_table_schema("node");

    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ(schema->columns.size(), 2u);
    ASSERT_EQ(state->executed.size(), 1u);
    EXPECT_EQ(state->executed[0].params, (std::vector<core::Value>{"dr_node"}));
}

TEST_F(SchemaIntrospectorTest, OracleSchemaBindsUpperCaseAndFoldsColumns) {
    auto db = make_manager(Driver::ORACLE);
    state->on("user_tab_columns", test::raw_result(
        {{"COLUMN_NAME", SQL_VARCHAR}, {"DATA_TYPE", SQL_VARCHAR}},
        {{"NID", "NUMBER"}, {"TITLE", "VARCHAR2"}}));

    SchemaIntrospector introspector(*db);
    auto schema = introspector.get_table_schema("node");

    ASSERT_TRUE(schema.has_value());
    EXPECT_EQ(state->executed[0].params, (std::vector<core::Value>{"DR_NODE"}));
    EXPECT_EQ(schema->columns[1].name, "title");
    EXPECT_TRUE(introspector.is_text_column(schema->columns[1]));
    EXPECT_FALSE(introspector.is_text_column(schema->columns[0]));
}

TEST_F(SchemaIntrospectorTest, NoColumnsMeansUnavailable) {
    auto db = make_manager(Driver::MSSQL);
    state->on("INFORMATION_SCHEMA.COLUMNS",
              test::raw_result({{"column_name", SQL_VARCHAR}, {"data_type", SQL_VARCHAR}}, {}));

    EXPECT_FALSE(SchemaIntrospector(*db).get_table_schema("missing").has_value());
}

TEST_F(SchemaIntrospectorTest, QueryFailureMeansUnavailable) {
    auto db = make_manager(Driver::PGSQL);
    state->fail_on("information_schema.columns", test::odbc_error("42P01", "relation does not exist"));

    EXPECT_FALSE(SchemaIntrospector(*db).get_table_schema("node").has_value());
}

TEST_F(SchemaIntrospectorTest, EveryListedTableHasASchema) {
    auto db = make_manager(Driver::PGSQL);
    state->on("pg_catalog.pg_tables", test::raw_result(
        {{"tablename", SQL_VARCHAR}}, {{"dr_node"}, {"dr_users"}}));
    state->on("information_schema.columns", test::raw_result(
        {{"column_name", SQL_VARCHAR}, {"data_type", SQL_VARCHAR}}, {{"id", "integer"}}));

    SchemaIntrospector introspector(*db);
    auto tables = introspector.list_tables();
    ASSERT_TRUE(tables.has_value());
    ASSERT_EQ(tables->size(), 2u);
    for (const auto& table : *tables) {
        EXPECT_TRUE(introspector.get_table_schema(table).has_value()) << table;
    }
}

TEST(TextLikeTypesTest, MatchesDialectSets) {
    EXPECT_EQ(&schema::text_like_types(Driver::MSSQL),
              &dialect::text_like_types(Driver::MSSQL));
    EXPECT_EQ(schema::text_like_types(Driver::ORACLE).count("clob"), 1u);
}
