#include "mysql_dialect.hpp"
#include "core/logger.hpp"

namespace sqlbridge::dialect {

const std::set<std::string> MySqlDialect::TEXT_TYPES = {
    "char", "varchar", "tinytext", "text", "mediumtext", "longtext"
};

std::string MySqlDialect::connection_string(const config::DatabaseConfig& config) const {
    return build_connection_string(config, {
        {"Server", config.host},
        {"Port", std::to_string(config.port)},
        {"Database", config.database},
        {"Uid", config.username},
        {"Pwd", config.password},
        {"CharSet", "utf8mb4"},
    });
}

std::string MySqlDialect::quote_identifier(std::string_view name) const {
    std::string quoted = "`";
    for (char c : name) {
        quoted += c;
        if (c == '`') {
            quoted += '`';
        }
    }
    quoted += '`';
    return quoted;
}

std::optional<SchemaQuery> MySqlDialect::table_schema_query(const std::string& physical_table) const {
    if (!is_safe_identifier(physical_table)) {
        LOG_ERROR("Invalid table name for schema retrieval: " + physical_table);
        return std::nullopt;
    }

    SchemaQuery schema;
    schema.query.sql = "DESCRIBE " + quote_identifier(physical_table);
    schema.name_column = "Field";
    schema.type_column = "Type";
    return schema;
}

BoundQuery MySqlDialect::text_search_query(const std::string& physical_table,
                                           const std::string& column,
                                           const std::string& pattern,
                                           int limit) const {
    BoundQuery query;
    query.sql = "SELECT * FROM " + quote_identifier(physical_table) +
                " WHERE LOWER(" + quote_identifier(column) + ") LIKE LOWER(?) ESCAPE '" +
                LIKE_ESCAPE + "' LIMIT " + std::to_string(limit);
    query.params = {pattern};
    return query;
}

std::string MySqlDialect::string_aggregate(std::string_view expression) const {
    return "GROUP_CONCAT(DISTINCT " + std::string(expression) + ")";
}

} // namespace sqlbridge::dialect
