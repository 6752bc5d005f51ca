#pragma once

#include "dialect.hpp"

namespace sqlbridge::dialect {

// PostgreSQL through psqlODBC; tables are looked up in schema "public"
class PostgresDialect : public Dialect {
public:
    static const std::set<std::string> TEXT_TYPES;

    config::Driver driver() const override { return config::Driver::PGSQL; }
    const char* display_name() const override { return "PostgreSQL"; }
    const char* default_odbc_driver() const override { return "PostgreSQL Unicode"; }

    std::string connection_string(const config::DatabaseConfig& config) const override;
    std::string quote_identifier(std::string_view name) const override;

    std::string list_tables_query() const override;
    std::string table_name_column() const override { return "tablename"; }

    std::optional<SchemaQuery> table_schema_query(const std::string& physical_table) const override;

    const std::set<std::string>& text_like_types() const override { return TEXT_TYPES; }

    BoundQuery text_search_query(const std::string& physical_table,
                                 const std::string& column,
                                 const std::string& pattern,
                                 int limit) const override;

    std::string string_aggregate(std::string_view expression) const override;
};

// Double quotes with embedded '"' doubled (PostgreSQL, Oracle)
std::string quote_with_double_quotes(std::string_view name);

} // namespace sqlbridge::dialect
