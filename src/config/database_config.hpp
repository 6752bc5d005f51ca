#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge::config {

// The four supported engines
enum class Driver {
    MYSQL,
    PGSQL,
    MSSQL,
    ORACLE
};

// "mysql", "pgsql", "mssql", "oracle" (case-insensitive).
// Throws core::DbError(UNSUPPORTED_DRIVER) for anything else.
Driver parse_driver(std::string_view name);

const char* driver_to_string(Driver driver);

// Connection settings for one database; immutable once handed to DbManager
struct DatabaseConfig {
    Driver driver = Driver::MYSQL;
    std::string host;
    int port = 0;
    std::string username;
    std::string password;
    std::string database;
    std::string prefix;             // Prepended to every logical table name

    std::string odbc_driver;        // Overrides the dialect's default ODBC driver name
    int login_timeout = 15;         // Seconds; 0 leaves the driver default

    // Names of required fields that are empty or out of range
    std::vector<std::string> missing_fields() const;

    // Throws core::DbError(CONFIG_INCOMPLETE) naming every missing field
    void validate() const;
};

// Reads a JSON object:
//   {"driver": "pgsql", "host": "localhost", "port": 5432, "username": "...",
//    "password": "...", "database": "...", "prefix": "dr_"}
// "port" may be a number or a numeric string. Throws core::DbError
// (CONFIG_INCOMPLETE) when the file cannot be read or parsed, and
// (UNSUPPORTED_DRIVER) for an unknown driver. Completeness is not checked here.
DatabaseConfig load_config_file(const std::string& path);

DatabaseConfig parse_config_json(const std::string& text);

} // namespace sqlbridge::config
