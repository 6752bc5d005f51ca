#include "dialect.hpp"
#include "mysql_dialect.hpp"
#include "postgres_dialect.hpp"
#include "sqlserver_dialect.hpp"
#include "oracle_dialect.hpp"
#include "core/db_error.hpp"
#include <algorithm>
#include <cctype>

namespace sqlbridge::dialect {

std::string Dialect::catalog_name(std::string_view identifier) const {
    return std::string(identifier);
}

std::string Dialect::fold_column_label(std::string_view label) const {
    return std::string(label);
}

std::string Dialect::normalize_table_name(std::string_view name) const {
    return std::string(name);
}

bool Dialect::is_text_like(std::string_view declared_type) const {
    std::string type(declared_type.substr(0, declared_type.find('(')));

    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    type.erase(type.begin(), std::find_if(type.begin(), type.end(), not_space));
    type.erase(std::find_if(type.rbegin(), type.rend(), not_space).base(), type.end());
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return text_like_types().count(type) > 0;
}

std::string Dialect::escape_like(std::string_view needle) const {
    std::string escaped;
    escaped.reserve(needle.size());
    for (char c : needle) {
        if (c == LIKE_ESCAPE || c == '%' || c == '_') {
            escaped += LIKE_ESCAPE;
        }
        escaped += c;
    }
    return escaped;
}

std::string Dialect::build_connection_string(
    const config::DatabaseConfig& config,
    const std::vector<std::pair<std::string, std::string>>& attributes) const {
    const std::string driver_name = config.odbc_driver.empty()
        ? std::string(default_odbc_driver())
        : config.odbc_driver;

    std::string result = "Driver=" + odbc_attribute_value(driver_name, true) + ";";
    for (const auto& [key, value] : attributes) {
        result += key + "=" + odbc_attribute_value(value) + ";";
    }
    return result;
}

std::unique_ptr<Dialect> make_dialect(config::Driver driver) {
    switch (driver) {
        case config::Driver::MYSQL: return std::make_unique<MySqlDialect>();
        case config::Driver::PGSQL: return std::make_unique<PostgresDialect>();
        case config::Driver::MSSQL: return std::make_unique<SqlServerDialect>();
        case config::Driver::ORACLE: return std::make_unique<OracleDialect>();
    }
    throw core::DbError(core::ErrorKind::UNSUPPORTED_DRIVER,
                        "Unsupported database driver: " +
                        std::to_string(static_cast<int>(driver)));
}

const std::set<std::string>& text_like_types(config::Driver driver) {
    switch (driver) {
        case config::Driver::MYSQL: return MySqlDialect::TEXT_TYPES;
        case config::Driver::PGSQL: return PostgresDialect::TEXT_TYPES;
        case config::Driver::MSSQL: return SqlServerDialect::TEXT_TYPES;
        case config::Driver::ORACLE: return OracleDialect::TEXT_TYPES;
    }
    throw core::DbError(core::ErrorKind::UNSUPPORTED_DRIVER,
                        "Unsupported database driver: " +
                        std::to_string(static_cast<int>(driver)));
}

bool is_safe_identifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    // ASCII only; std::isalnum would follow the C locale
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_';
    });
}

std::string odbc_attribute_value(std::string_view value, bool force_braces) {
    bool needs_braces = force_braces ||
        value.find_first_of(";{}") != std::string_view::npos ||
        (!value.empty() && (std::isspace(static_cast<unsigned char>(value.front())) ||
                            std::isspace(static_cast<unsigned char>(value.back()))));

    if (!needs_braces) {
        return std::string(value);
    }

    std::string quoted = "{";
    for (char c : value) {
        quoted += c;
        if (c == '}') {
            quoted += '}';
        }
    }
    quoted += '}';
    return quoted;
}

} // namespace sqlbridge::dialect
