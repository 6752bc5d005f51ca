#pragma once

#include "dialect.hpp"

namespace sqlbridge::dialect {

/**
 * @brief Oracle through the Oracle Instant Client ODBC driver
 *
 * The catalog stores unquoted identifiers upper-case. Labels and table names
 * that are entirely upper-case are folded to lower case on the way out, and
 * all-lower-case names are raised again before they reach the catalog or a
 * quoted identifier, so the rest of the library sees the same names as on the
 * other engines.
 */
class OracleDialect : public Dialect {
public:
    static const std::set<std::string> TEXT_TYPES;

    config::Driver driver() const override { return config::Driver::ORACLE; }
    const char* display_name() const override { return "Oracle"; }
    const char* default_odbc_driver() const override { return "Oracle ODBC Driver"; }

    // DBQ is an EZConnect string; the database field names the service
    std::string connection_string(const config::DatabaseConfig& config) const override;
    std::string quote_identifier(std::string_view name) const override;

    std::string catalog_name(std::string_view identifier) const override;
    std::string fold_column_label(std::string_view label) const override;

    std::string list_tables_query() const override { return "SELECT table_name FROM user_tables"; }
    std::string table_name_column() const override { return "table_name"; }
    std::string normalize_table_name(std::string_view name) const override;

    std::optional<SchemaQuery> table_schema_query(const std::string& physical_table) const override;

    const std::set<std::string>& text_like_types() const override { return TEXT_TYPES; }

    // ROWNUM filter around a subquery
    BoundQuery text_search_query(const std::string& physical_table,
                                 const std::string& column,
                                 const std::string& pattern,
                                 int limit) const override;

    std::string string_aggregate(std::string_view expression) const override;
};

} // namespace sqlbridge::dialect
