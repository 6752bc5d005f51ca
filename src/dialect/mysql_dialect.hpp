#pragma once

#include "dialect.hpp"

namespace sqlbridge::dialect {

// MySQL / MariaDB through MySQL Connector/ODBC
class MySqlDialect : public Dialect {
public:
    static const std::set<std::string> TEXT_TYPES;

    config::Driver driver() const override { return config::Driver::MYSQL; }
    const char* display_name() const override { return "MySQL"; }
    const char* default_odbc_driver() const override { return "MySQL ODBC 8.0 Unicode Driver"; }

    std::string connection_string(const config::DatabaseConfig& config) const override;
    std::string quote_identifier(std::string_view name) const override;

    // Default sql_mode: backslash escapes inside '...' and "..." literals
    LexicalRules lexical_rules() const override { return {false, true}; }

    std::string list_tables_query() const override { return "SHOW TABLES"; }
    std::string table_name_column() const override { return {}; }

    // DESCRIBE cannot take a bound table name, so the name is pattern-checked
    std::optional<SchemaQuery> table_schema_query(const std::string& physical_table) const override;

    const std::set<std::string>& text_like_types() const override { return TEXT_TYPES; }

    BoundQuery text_search_query(const std::string& physical_table,
                                 const std::string& column,
                                 const std::string& pattern,
                                 int limit) const override;

    std::string string_aggregate(std::string_view expression) const override;
};

} // namespace sqlbridge::dialect
