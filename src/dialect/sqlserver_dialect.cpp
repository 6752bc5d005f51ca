#include "sqlserver_dialect.hpp"

namespace sqlbridge::dialect {

const std::set<std::string> SqlServerDialect::TEXT_TYPES = {
    "char", "varchar", "text", "nchar", "nvarchar", "ntext"
};

std::string SqlServerDialect::connection_string(const config::DatabaseConfig& config) const {
    return build_connection_string(config, {
        {"Server", config.host + "," + std::to_string(config.port)},
        {"Database", config.database},
        {"Uid", config.username},
        {"Pwd", config.password},
    });
}

std::string SqlServerDialect::quote_identifier(std::string_view name) const {
    std::string quoted = "[";
    for (char c : name) {
        quoted += c;
        if (c == ']') {
            quoted += ']';
        }
    }
    quoted += ']';
    return quoted;
}

std::string SqlServerDialect::list_tables_query() const {
    return "SELECT TABLE_NAME AS table_name FROM INFORMATION_SCHEMA.TABLES "
           "WHERE TABLE_TYPE = 'BASE TABLE' AND TABLE_CATALOG = DB_NAME()";
}

std::optional<SchemaQuery> SqlServerDialect::table_schema_query(const std::string& physical_table) const {
    SchemaQuery schema;
    schema.query.sql =
        "SELECT COLUMN_NAME AS column_name, DATA_TYPE AS data_type "
        "FROM INFORMATION_SCHEMA.COLUMNS "
        "WHERE TABLE_NAME = ? AND TABLE_CATALOG = DB_NAME() ORDER BY ORDINAL_POSITION";
    schema.query.params = {physical_table};
    schema.name_column = "column_name";
    schema.type_column = "data_type";
    return schema;
}

std::string SqlServerDialect::escape_like(std::string_view needle) const {
    std::string escaped;
    escaped.reserve(needle.size());
    for (char c : needle) {
        if (c == LIKE_ESCAPE || c == '%' || c == '_' || c == '[') {
            escaped += LIKE_ESCAPE;
        }
        escaped += c;
    }
    return escaped;
}

BoundQuery SqlServerDialect::text_search_query(const std::string& physical_table,
                                               const std::string& column,
                                               const std::string& pattern,
                                               int limit) const {
    BoundQuery query;
    query.sql = "SELECT TOP (?) * FROM " + quote_identifier(physical_table) +
                " WHERE " + quote_identifier(column) + " LIKE ? ESCAPE '" + LIKE_ESCAPE + "'";
    query.params = {limit, pattern};
    return query;
}

std::string SqlServerDialect::string_aggregate(std::string_view expression) const {
    const std::string expr(expression);
    return "STRING_AGG(" + expr + ", ',') WITHIN GROUP (ORDER BY " + expr + ")";
}

} // namespace sqlbridge::dialect
