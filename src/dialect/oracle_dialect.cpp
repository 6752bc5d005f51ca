#include "oracle_dialect.hpp"
#include "postgres_dialect.hpp"
#include <algorithm>
#include <cctype>

namespace sqlbridge::dialect {

namespace {

bool has_lower(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](char c) { return c >= 'a' && c <= 'z'; });
}

bool has_upper(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
}

std::string ascii_transform(std::string_view text, int (*fn)(int)) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [fn](unsigned char c) { return static_cast<char>(fn(c)); });
    return result;
}

} // anonymous namespace

const std::set<std::string> OracleDialect::TEXT_TYPES = {
    "char", "varchar2", "nchar", "nvarchar2", "clob", "nclob"
};

std::string OracleDialect::connection_string(const config::DatabaseConfig& config) const {
    return build_connection_string(config, {
        {"Dbq", "//" + config.host + ":" + std::to_string(config.port) + "/" + config.database},
        {"Uid", config.username},
        {"Pwd", config.password},
    });
}

std::string OracleDialect::quote_identifier(std::string_view name) const {
    return quote_with_double_quotes(name);
}

std::string OracleDialect::catalog_name(std::string_view identifier) const {
    if (has_upper(identifier)) {
        return std::string(identifier);
    }
    return ascii_transform(identifier, std::toupper);
}

std::string OracleDialect::fold_column_label(std::string_view label) const {
    if (has_lower(label) || !has_upper(label)) {
        return std::string(label);
    }
    return ascii_transform(label, std::tolower);
}

std::string OracleDialect::normalize_table_name(std::string_view name) const {
    return fold_column_label(name);
}

std::optional<SchemaQuery> OracleDialect::table_schema_query(const std::string& physical_table) const {
    SchemaQuery schema;
    schema.query.sql =
        "SELECT column_name, data_type FROM user_tab_columns "
        "WHERE table_name = ? ORDER BY column_id";
    schema.query.params = {catalog_name(physical_table)};
    schema.name_column = "column_name";
    schema.type_column = "data_type";
    return schema;
}

BoundQuery OracleDialect::text_search_query(const std::string& physical_table,
                                            const std::string& column,
                                            const std::string& pattern,
                                            int limit) const {
    BoundQuery query;
    query.sql = "SELECT * FROM (SELECT * FROM " + quote_identifier(catalog_name(physical_table)) +
                " WHERE UPPER(" + quote_identifier(catalog_name(column)) + ") LIKE UPPER(?) ESCAPE '" +
                LIKE_ESCAPE + "') WHERE ROWNUM <= ?";
    query.params = {pattern, limit};
    return query;
}

std::string OracleDialect::string_aggregate(std::string_view expression) const {
    const std::string expr(expression);
    return "LISTAGG(" + expr + ", ',') WITHIN GROUP (ORDER BY " + expr + ")";
}

} // namespace sqlbridge::dialect
