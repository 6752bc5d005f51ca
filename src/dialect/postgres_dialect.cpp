#include "postgres_dialect.hpp"

namespace sqlbridge::dialect {

const std::set<std::string> PostgresDialect::TEXT_TYPES = {
    "character varying", "varchar", "character", "char", "text", "citext"
};

std::string quote_with_double_quotes(std::string_view name) {
    std::string quoted = "\"";
    for (char c : name) {
        quoted += c;
        if (c == '"') {
            quoted += '"';
        }
    }
    quoted += '"';
    return quoted;
}

std::string PostgresDialect::connection_string(const config::DatabaseConfig& config) const {
    return build_connection_string(config, {
        {"Server", config.host},
        {"Port", std::to_string(config.port)},
        {"Database", config.database},
        {"Uid", config.username},
        {"Pwd", config.password},
    });
}

std::string PostgresDialect::quote_identifier(std::string_view name) const {
    return quote_with_double_quotes(name);
}

std::string PostgresDialect::list_tables_query() const {
    return "SELECT tablename FROM pg_catalog.pg_tables WHERE schemaname = 'public'";
}

std::optional<SchemaQuery> PostgresDialect::table_schema_query(const std::string& physical_table) const {
    SchemaQuery schema;
    schema.query.sql =
        "SELECT column_name, data_type FROM information_schema.columns "
        "WHERE table_name = ? AND table_schema = 'public' ORDER BY ordinal_position";
    schema.query.params = {physical_table};
    schema.name_column = "column_name";
    schema.type_column = "data_type";
    return schema;
}

BoundQuery PostgresDialect::text_search_query(const std::string& physical_table,
                                              const std::string& column,
                                              const std::string& pattern,
                                              int limit) const {
    BoundQuery query;
    query.sql = "SELECT * FROM " + quote_identifier(physical_table) +
                " WHERE " + quote_identifier(column) + " ILIKE ? ESCAPE '" +
                LIKE_ESCAPE + "' LIMIT " + std::to_string(limit);
    query.params = {pattern};
    return query;
}

std::string PostgresDialect::string_aggregate(std::string_view expression) const {
    return "STRING_AGG(DISTINCT " + std::string(expression) + ", ',')";
}

} // namespace sqlbridge::dialect
