#include <algorithm>
#include <cctype>
#include <charconv>
#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "sqlbridge/version.hpp"
#include "config/database_config.hpp"
#include "core/db_error.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "drupal/content_repository.hpp"
#include "query/db_manager.hpp"
#include "schema/schema_introspector.hpp"
#include "search/table_search.hpp"
#include "reporting/console_reporter.hpp"
#include "reporting/json_reporter.hpp"

using namespace sqlbridge;

namespace {

// Command-line values that override the config file
struct ConnectionOptions {
    std::string config_file;
    std::string driver;
    std::string host;
    int port = 0;
    std::string user;
    std::string password;
    std::string database;
    std::string prefix;
    std::string odbc_driver;

    CLI::Option* driver_opt = nullptr;
    CLI::Option* host_opt = nullptr;
    CLI::Option* port_opt = nullptr;
    CLI::Option* user_opt = nullptr;
    CLI::Option* password_opt = nullptr;
    CLI::Option* database_opt = nullptr;
    CLI::Option* prefix_opt = nullptr;
    CLI::Option* odbc_driver_opt = nullptr;
};

config::DatabaseConfig build_config(const ConnectionOptions& opts) {
    config::DatabaseConfig cfg;
    bool have_driver = false;

    if (!opts.config_file.empty()) {
        cfg = config::load_config_file(opts.config_file);
        have_driver = true;
    }

    if (*opts.driver_opt) {
        cfg.driver = config::parse_driver(opts.driver);
        have_driver = true;
    }
    if (!have_driver) {
        throw core::DbError(core::ErrorKind::CONFIG_INCOMPLETE,
                            "No database driver given (use --driver or --config)");
    }

    if (*opts.host_opt) cfg.host = opts.host;
    if (*opts.port_opt) cfg.port = opts.port;
    if (*opts.user_opt) cfg.username = opts.user;
    if (*opts.password_opt) cfg.password = opts.password;
    if (*opts.database_opt) cfg.database = opts.database;
    if (*opts.prefix_opt) cfg.prefix = opts.prefix;
    if (*opts.odbc_driver_opt) cfg.odbc_driver = opts.odbc_driver;

    return cfg;
}

std::string describe_target(const config::DatabaseConfig& cfg) {
    return std::string(config::driver_to_string(cfg.driver)) + "://" + cfg.username + "@" +
           cfg.host + ":" + std::to_string(cfg.port) + "/" + cfg.database +
           (cfg.prefix.empty() ? "" : " (prefix " + cfg.prefix + ")");
}

// Integers are bound as integers, everything else as text
core::Value parse_cli_param(const std::string& text) {
    long long number = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, number);
    if (!text.empty() && ec == std::errc() && ptr == end) {
        return core::Value(number);
    }
    return core::Value(text);
}

bool is_select_statement(const std::string& sql) {
    auto first = std::find_if(sql.begin(), sql.end(),
                              [](unsigned char c) { return !std::isspace(c); });
    std::string head(first, sql.end());
    head = head.substr(0, 6);
    std::transform(head.begin(), head.end(), head.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return head == "SELECT";
}

int exit_code_for(core::ErrorKind kind) {
    switch (kind) {
        case core::ErrorKind::CONFIG_INCOMPLETE:
        case core::ErrorKind::UNSUPPORTED_DRIVER:
            return 3;
        case core::ErrorKind::CONNECTION_FAILURE:
            return 2;
        default:
            return 1;
    }
}

// Reports a statement result; 0 on success, the error's exit code otherwise
int finish_result(reporting::Reporter& reporter, const query::QueryResult& result) {
    reporter.report_result(result);
    return result.ok() ? 0 : exit_code_for(result.error_kind());
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{
        "SQLBridge - multi-database access tool\n"
        "\n"
        "  Connects to MySQL, PostgreSQL, SQL Server or Oracle through ODBC,\n"
        "  lists and describes prefixed tables, runs parameterized queries,\n"
        "  searches every text column and reads Drupal content.\n"
        "\n"
        "Examples:\n"
        "  sqlbridge --config site.json tables\n"
        "  sqlbridge --driver pgsql --host localhost --port 5432 --user me \\\n"
        "      --password secret --database drupal --prefix dr_ search \"hello\"\n"
        "  sqlbridge --config site.json -o json query \"SELECT * FROM {node} WHERE nid = ?\" 42\n",
        "sqlbridge"
    };

    app.set_version_flag("--version,-V", SQLBRIDGE_VERSION);
    app.require_subcommand(1);

    ConnectionOptions conn_opts;
    app.add_option("--config", conn_opts.config_file, "JSON file with the connection settings")
        ->check(CLI::ExistingFile);
    conn_opts.driver_opt = app.add_option("--driver", conn_opts.driver,
                                          "Database driver: mysql, pgsql, mssql or oracle");
    conn_opts.host_opt = app.add_option("--host", conn_opts.host, "Database host");
    conn_opts.port_opt = app.add_option("--port", conn_opts.port, "Database port")
        ->check(CLI::Range(1, 65535));
    conn_opts.user_opt = app.add_option("--user", conn_opts.user, "Database user");
    conn_opts.password_opt = app.add_option("--password", conn_opts.password, "Database password");
    conn_opts.database_opt = app.add_option("--database", conn_opts.database,
                                            "Database name (Oracle: service name)");
    conn_opts.prefix_opt = app.add_option("--prefix", conn_opts.prefix, "Table name prefix");
    conn_opts.odbc_driver_opt = app.add_option("--odbc-driver", conn_opts.odbc_driver,
                                               "ODBC driver name to use instead of the default");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Show connection target and matching rows");

    std::string output_format = "console";
    app.add_option("-o,--output", output_format,
                   "Output format: 'console' (default) or 'json'")
        ->check(CLI::IsMember({"console", "json"}));

    std::string json_file;
    app.add_option("-f,--file", json_file,
                   "Write JSON output to FILE instead of stdout");

    std::string log_level = "warn";
    app.add_option("--log-level", log_level,
                   "Log level: trace, debug, info, warn, error, fatal (default warn)");

    std::string log_file;
    app.add_option("--log-file", log_file, "Append log messages to FILE");

    // Subcommands
    auto* tables_cmd = app.add_subcommand("tables", "List tables carrying the prefix");

    std::string schema_table;
    auto* schema_cmd = app.add_subcommand("schema", "Describe the columns of a table");
    schema_cmd->add_option("table", schema_table, "Logical table name (without prefix)")->required();

    std::string sql;
    std::vector<std::string> sql_params;
    bool allow_write = false;
    auto* query_cmd = app.add_subcommand("query", "Run a statement with {table} placeholders and ? markers");
    query_cmd->add_option("sql", sql, "SQL text")->required();
    query_cmd->add_option("params", sql_params, "Values bound to the ? markers, in order");
    query_cmd->add_flag("--allow-write", allow_write, "Permit statements other than SELECT");

    std::string needle;
    int search_limit = 10;
    auto* search_cmd = app.add_subcommand("search", "Search every text column of every table");
    search_cmd->add_option("needle", needle, "Text to look for (case-insensitive)")->required();
    search_cmd->add_option("--limit", search_limit, "Maximum rows per matching column (default 10)");

    long long nid = 0;
    auto* node_cmd = app.add_subcommand("node", "Show a Drupal node");
    node_cmd->add_option("nid", nid, "Node ID")->required();

    auto* content_types_cmd = app.add_subcommand("content-types", "List Drupal content types");
    auto* vocabularies_cmd = app.add_subcommand("vocabularies", "List Drupal taxonomy vocabularies");

    long long tid = 0;
    auto* term_cmd = app.add_subcommand("term", "Show a Drupal taxonomy term");
    term_cmd->add_option("tid", tid, "Term ID")->required();

    long long uid = 0;
    auto* user_cmd = app.add_subcommand("user", "Show a Drupal user with roles");
    user_cmd->add_option("uid", uid, "User ID")->required();

    long long paragraph_nid = 0;
    std::string paragraph_field;
    auto* paragraphs_cmd = app.add_subcommand("paragraphs", "List paragraphs referenced by a node field");
    paragraphs_cmd->add_option("nid", paragraph_nid, "Node ID")->required();
    paragraphs_cmd->add_option("field", paragraph_field, "Paragraph field name, e.g. field_content")->required();

    CLI11_PARSE(app, argc, argv);

    auto level = core::parse_log_level(log_level);
    if (!level) {
        std::cerr << "Error: unknown log level '" << log_level << "'\n";
        return 3;
    }
    core::Logger::instance().set_level(*level);
    if (!log_file.empty()) {
        core::Logger::instance().set_output(log_file);
    }

    try {
        // Create reporter
        std::unique_ptr<reporting::Reporter> reporter;

        if (output_format == "json") {
            reporter = std::make_unique<reporting::JsonReporter>(json_file);
        } else {
            reporter = std::make_unique<reporting::ConsoleReporter>(std::cout, verbose);
        }

        const config::DatabaseConfig cfg = build_config(conn_opts);
        const std::string command = app.get_subcommands().front()->get_name();
        reporter->report_start(command, describe_target(cfg));

        query::DbManager db(cfg);
        drupal::ContentRepository content(db);
        int rc = 0;

        if (*tables_cmd) {
            schema::SchemaIntrospector introspector(db);
            auto tables = introspector.list_tables();
            if (tables) {
                reporter->report_tables(*tables);
            } else {
                reporter->report_error("Could not list tables");
                rc = 1;
            }
        } else if (*schema_cmd) {
            schema::SchemaIntrospector introspector(db);
            auto schema = introspector.get_table_schema(schema_table);
            if (schema) {
                reporter->report_schema(*schema);
            } else {
                reporter->report_error("Schema unavailable for table " + schema_table);
                rc = 1;
            }
        } else if (*query_cmd) {
            if (!allow_write && !is_select_statement(sql)) {
                reporter->report_error("Only SELECT statements are allowed without --allow-write");
                rc = 1;
            } else {
                std::vector<core::Value> params;
                for (const auto& p : sql_params) {
                    params.push_back(parse_cli_param(p));
                }
                rc = finish_result(*reporter, db.execute(sql, params));
            }
        } else if (*search_cmd) {
            if (search_limit <= 0) {
                reporter->report_error("--limit must be positive");
                rc = 1;
            } else {
                search::TableSearch searcher(db);
                reporter->report_findings(needle, searcher.search_all_tables(needle, search_limit));
            }
        } else if (*node_cmd) {
            rc = finish_result(*reporter, content.get_node_by_id(nid));
        } else if (*content_types_cmd) {
            rc = finish_result(*reporter, content.list_content_types());
        } else if (*vocabularies_cmd) {
            rc = finish_result(*reporter, content.list_vocabularies());
        } else if (*term_cmd) {
            rc = finish_result(*reporter, content.get_taxonomy_term_by_id(tid));
        } else if (*user_cmd) {
            rc = finish_result(*reporter, content.get_user_by_id(uid));
        } else if (*paragraphs_cmd) {
            rc = finish_result(*reporter, content.list_paragraphs_by_node_id(paragraph_nid, paragraph_field));
        }

        reporter->report_end();
        return rc;

    } catch (const core::DbError& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        for (const auto& diag : e.diagnostics()) {
            std::cerr << "  [" << diag.sqlstate << "] (" << diag.native_error << ") "
                      << diag.message << "\n";
        }
        return exit_code_for(e.kind());
    } catch (const core::OdbcError& e) {
        std::cerr << "\nODBC Error: " << e.what() << "\n";
        std::cerr << e.format_diagnostics() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 3;
    }
}
