#include <gtest/gtest.h>
#include "reporting/json_reporter.hpp"
#include "reporting/console_reporter.hpp"
#include "query/result_normalizer.hpp"
#include <sstream>

using namespace sqlbridge;
using reporting::JsonReporter;
using reporting::ConsoleReporter;

TEST(JsonConversionTest, ValuesKeepTheirType) {
    nlohmann::json j = core::Row{{"id", 1}, {"name", "a"}, {"ratio", 0.5}, {"on", true}, {"gone", nullptr}};

    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["name"], "a");
    EXPECT_DOUBLE_EQ(j["ratio"].get<double>(), 0.5);
    EXPECT_EQ(j["on"], true);
    EXPECT_TRUE(j["gone"].is_null());
}

TEST(JsonReporterTest, RowsResult) {
    JsonReporter reporter;
    reporter.report_start("query", "mysql://u@h:3306/d");
    reporter.report_result(query::QueryResult::with_rows({core::Row{{"nid", 5}}}));

    const auto& doc = reporter.document();
    EXPECT_EQ(doc["command"], "query");
    EXPECT_EQ(doc["result"]["status"], "ROWS");
    ASSERT_EQ(doc["result"]["rows"].size(), 1u);
    EXPECT_EQ(doc["result"]["rows"][0]["nid"], 5);
}

TEST(JsonReporterTest, NoResultSetCarriesAffectedRows) {
    JsonReporter reporter;
    reporter.report_start("query", "t");
    reporter.report_result(query::QueryResult::no_result_set(3));

    EXPECT_EQ(reporter.document()["result"]["status"], "NO_RESULT_SET");
    EXPECT_EQ(reporter.document()["result"]["affected_rows"], 3);
}

TEST(JsonReporterTest, ErrorResultCarriesKindAndDiagnostics) {
    core::OdbcDiagnostic diag;
    diag.sqlstate = "42S02";
    diag.native_error = 1146;
    diag.message = "Table doesn't exist";

    JsonReporter reporter;
    reporter.report_start("node", "t");
    reporter.report_result(query::QueryResult::error(core::ErrorKind::QUERY_FAILURE, "failed", {diag}));

    const auto& result = reporter.document()["result"];
    EXPECT_EQ(result["status"], "ERROR");
    EXPECT_EQ(result["error_kind"], "QueryFailure");
    EXPECT_EQ(result["error"], "failed");
    EXPECT_EQ(result["diagnostics"][0]["sqlstate"], "42S02");
    EXPECT_EQ(result["diagnostics"][0]["native_error"], 1146);
}

TEST(JsonReporterTest, FindingsUseDocumentedKeys) {
    search::SearchFinding finding;
    finding.table_name = "node";
    finding.column_name = "title";
    finding.matching_rows = {core::Row{{"nid", 1}, {"title", "Hello"}}};

    JsonReporter reporter;
    reporter.report_start("search", "t");
    reporter.report_findings("hello", {finding});

    const auto& findings = reporter.document()["findings"];
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0]["table_name"], "node");
    EXPECT_EQ(findings[0]["column_name"], "title");
    EXPECT_EQ(findings[0]["matching_rows"][0]["title"], "Hello");
    EXPECT_EQ(reporter.document()["needle"], "hello");
}

TEST(JsonReporterTest, TablesAndSchema) {
    schema::TableSchema schema;
    schema.table = "node";
    schema.columns = {{"nid", "int"}, {"title", "varchar(255)"}};

    JsonReporter reporter;
    reporter.report_start("schema", "t");
    reporter.report_tables({"node", "users"});
    reporter.report_schema(schema);

    const auto& doc = reporter.document();
    EXPECT_EQ(doc["tables"], nlohmann::json::array({"node", "users"}));
    EXPECT_EQ(doc["schema"]["table"], "node");
    EXPECT_EQ(doc["schema"]["columns"][1]["type"], "varchar(255)");
}

TEST(JsonReporterTest, DumpReplacesInvalidUtf8) {
    JsonReporter reporter;
    reporter.report_start("query", "t");
    reporter.report_result(query::QueryResult::with_rows({core::Row{{"title", std::string("caf\xE9")}}}));

    std::string text;
    ASSERT_NO_THROW(text = reporter.dump());
    EXPECT_NE(text.find("caf\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(text.find("\n  \""), std::string::npos);
}

TEST(ConsoleReporterTest, PrintsRowsAndErrors) {
    std::ostringstream out;
    ConsoleReporter reporter(out);

    reporter.report_start("query", "t");
    reporter.report_result(query::QueryResult::with_rows({core::Row{{"nid", 5}, {"title", "About"}}}));
    reporter.report_result(query::QueryResult::error(core::ErrorKind::UNSAFE_IDENTIFIER, "bad field"));
    reporter.report_end();

    const std::string text = out.str();
    EXPECT_NE(text.find("nid: 5"), std::string::npos);
    EXPECT_NE(text.find("title: About"), std::string::npos);
    EXPECT_NE(text.find("(1 rows)"), std::string::npos);
    EXPECT_NE(text.find("UnsafeIdentifier: bad field"), std::string::npos);
}

TEST(ConsoleReporterTest, PrintsFindingsSummary) {
    search::SearchFinding finding;
    finding.table_name = "users";
    finding.column_name = "name";
    finding.matching_rows = {core::Row{{"name", "admin"}}};

    std::ostringstream out;
    ConsoleReporter reporter(out);
    reporter.report_findings("adm", {finding});
    reporter.report_findings("zzz", {});

    const std::string text = out.str();
    EXPECT_NE(text.find("users.name (1 rows)"), std::string::npos);
    EXPECT_NE(text.find("No matches"), std::string::npos);
}
