#include "database_config.hpp"
#include "core/db_error.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace sqlbridge::config {

namespace {

std::string to_lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string string_field(const nlohmann::json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw core::DbError(core::ErrorKind::CONFIG_INCOMPLETE,
                            std::string("Config field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

int int_field(const nlohmann::json& root, const char* key, int fallback) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_number_integer()) {
        return it->get<int>();
    }
    if (it->is_string()) {
        const std::string text = it->get<std::string>();
        if (text.empty()) {
            return fallback;
        }
        try {
            std::size_t consumed = 0;
            int value = std::stoi(text, &consumed);
            if (consumed == text.size()) {
                return value;
            }
        } catch (const std::logic_error&) {
            // falls through to the error below
        }
    }
    throw core::DbError(core::ErrorKind::CONFIG_INCOMPLETE,
                        std::string("Config field '") + key + "' must be an integer");
}

} // anonymous namespace

Driver parse_driver(std::string_view name) {
    const std::string lower = to_lower(name);

    if (lower == "mysql") return Driver::MYSQL;
    if (lower == "pgsql") return Driver::PGSQL;
    if (lower == "mssql") return Driver::MSSQL;
    if (lower == "oracle") return Driver::ORACLE;

    throw core::DbError(core::ErrorKind::UNSUPPORTED_DRIVER,
                        "Unsupported database driver: " + std::string(name));
}

const char* driver_to_string(Driver driver) {
    switch (driver) {
        case Driver::MYSQL: return "mysql";
        case Driver::PGSQL: return "pgsql";
        case Driver::MSSQL: return "mssql";
        case Driver::ORACLE: return "oracle";
        default: return "unknown";
    }
}

std::vector<std::string> DatabaseConfig::missing_fields() const {
    std::vector<std::string> missing;
    if (host.empty()) missing.emplace_back("host");
    if (port <= 0 || port > 65535) missing.emplace_back("port");
    if (username.empty()) missing.emplace_back("username");
    if (password.empty()) missing.emplace_back("password");
    if (database.empty()) missing.emplace_back("database");
    return missing;
}

void DatabaseConfig::validate() const {
    auto missing = missing_fields();
    if (missing.empty()) {
        return;
    }

    std::ostringstream oss;
    oss << "Database configuration is incomplete, missing:";
    for (const auto& field : missing) {
        oss << " " << field;
    }
    throw core::DbError(core::ErrorKind::CONFIG_INCOMPLETE, oss.str());
}

DatabaseConfig parse_config_json(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::DbError(core::ErrorKind::CONFIG_INCOMPLETE,
                            std::string("Invalid configuration JSON: ") + e.what());
    }

    if (!root.is_object()) {
        throw core::DbError(core::ErrorKind::CONFIG_INCOMPLETE,
                            "Configuration must be a JSON object");
    }

    const std::string driver = string_field(root, "driver");
    if (driver.empty()) {
        throw core::DbError(core::ErrorKind::CONFIG_INCOMPLETE,
                            "Database configuration is incomplete, missing: driver");
    }

    DatabaseConfig config;
    config.driver = parse_driver(driver);
    config.host = string_field(root, "host");
    config.port = int_field(root, "port", 0);
    config.username = string_field(root, "username");
    config.password = string_field(root, "password");
    config.database = string_field(root, "database");
    config.prefix = string_field(root, "prefix");
    config.odbc_driver = string_field(root, "odbc_driver");
    config.login_timeout = int_field(root, "login_timeout", config.login_timeout);
    return config;
}

DatabaseConfig load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw core::DbError(core::ErrorKind::CONFIG_INCOMPLETE,
                            "Cannot read configuration file: " + path);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parse_config_json(content.str());
}

} // namespace sqlbridge::config
