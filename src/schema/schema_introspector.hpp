#pragma once

#include "query/db_manager.hpp"
#include "config/database_config.hpp"
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge::schema {

struct ColumnInfo {
    std::string name;
    std::string declared_type;
};

// Columns of one table in catalog order, keyed by the logical table name
struct TableSchema {
    std::string table;
    std::vector<ColumnInfo> columns;

    const ColumnInfo* find(std::string_view column) const;
    bool has_column(std::string_view column) const { return find(column) != nullptr; }
};

/**
 * @brief Table and column discovery through the dialect's catalog queries
 *
 * Both operations report failure as std::nullopt after logging; they never
 * throw for database errors.
 */
class SchemaIntrospector {
public:
    explicit SchemaIntrospector(query::DbManager& db);

    // Logical names (prefix stripped) of the tables carrying the prefix, sorted
    std::optional<std::vector<std::string>> list_tables();

    // std::nullopt for an unsafe name, a failed query or a table with no columns
    std::optional<TableSchema> get_table_schema(std::string_view logical_table);

    bool is_text_column(const ColumnInfo& column) const;

private:
    query::DbManager& db_;
};

const std::set<std::string>& text_like_types(config::Driver driver);

} // namespace sqlbridge::schema
