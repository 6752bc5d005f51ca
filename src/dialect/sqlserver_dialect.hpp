#pragma once

#include "dialect.hpp"

namespace sqlbridge::dialect {

// Microsoft SQL Server through the Microsoft ODBC driver
class SqlServerDialect : public Dialect {
public:
    static const std::set<std::string> TEXT_TYPES;

    config::Driver driver() const override { return config::Driver::MSSQL; }
    const char* display_name() const override { return "SQL Server"; }
    const char* default_odbc_driver() const override { return "ODBC Driver 17 for SQL Server"; }

    // Server is written "host,port"
    std::string connection_string(const config::DatabaseConfig& config) const override;
    std::string quote_identifier(std::string_view name) const override;

    LexicalRules lexical_rules() const override { return {true, false}; }

    std::string list_tables_query() const override;
    std::string table_name_column() const override { return "table_name"; }

    std::optional<SchemaQuery> table_schema_query(const std::string& physical_table) const override;

    const std::set<std::string>& text_like_types() const override { return TEXT_TYPES; }

    // '[' opens a character class in T-SQL LIKE patterns
    std::string escape_like(std::string_view needle) const override;

    // TOP (?) binds the limit ahead of the pattern
    BoundQuery text_search_query(const std::string& physical_table,
                                 const std::string& column,
                                 const std::string& pattern,
                                 int limit) const override;

    std::string string_aggregate(std::string_view expression) const override;
};

} // namespace sqlbridge::dialect
