#include "schema_introspector.hpp"
#include "core/db_error.hpp"
#include "core/logger.hpp"
#include <algorithm>

namespace sqlbridge::schema {

namespace {

std::string cell_text(const core::Value& value) {
    return value.is_text() ? value.as_text() : value.to_string();
}

} // anonymous namespace

const ColumnInfo* TableSchema::find(std::string_view column) const {
    for (const auto& info : columns) {
        if (info.name == column) {
            return &info;
        }
    }
    return nullptr;
}

SchemaIntrospector::SchemaIntrospector(query::DbManager& db)
    : db_(db) {
}

std::optional<std::vector<std::string>> SchemaIntrospector::list_tables() {
    const dialect::Dialect& dialect = db_.dialect();
    const std::string& prefix = db_.config().prefix;

    query::QueryResult result = db_.execute(dialect.list_tables_query());
    if (!result.ok()) {
        LOG_ERROR("Could not list tables: " + result.error_message());
        return std::nullopt;
    }

    const std::string name_column = dialect.table_name_column();
    std::vector<std::string> tables;

    for (const auto& row : result.rows()) {
        if (row.empty()) {
            continue;
        }

        const core::Value* cell = name_column.empty() ? &row.at(std::size_t{0}) : row.find(name_column);
        if (!cell || cell->is_null()) {
            continue;
        }

        std::string name = dialect.normalize_table_name(cell_text(*cell));
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        tables.push_back(name.substr(prefix.size()));
    }

    std::sort(tables.begin(), tables.end());
    LOG_DEBUG("Found " + std::to_string(tables.size()) + " tables");
    return tables;
}

std::optional<TableSchema> SchemaIntrospector::get_table_schema(std::string_view logical_table) {
    const dialect::Dialect& dialect = db_.dialect();
    const std::string physical = db_.physical_table_name(logical_table);

    auto schema_query = dialect.table_schema_query(physical);
    if (!schema_query) {
        LOG_ERROR(std::string(core::error_kind_to_string(core::ErrorKind::UNSAFE_IDENTIFIER)) +
                  ": " + physical);
        return std::nullopt;
    }

    query::QueryResult result = db_.execute(schema_query->query);
    if (!result.ok() || !result.has_rows()) {
        LOG_ERROR(std::string(core::error_kind_to_string(core::ErrorKind::SCHEMA_UNAVAILABLE)) +
                  ": " + physical + (result.ok() ? "" : " (" + result.error_message() + ")"));
        return std::nullopt;
    }

    TableSchema schema;
    schema.table = std::string(logical_table);

    for (const auto& row : result.rows()) {
        const core::Value* name = row.find(schema_query->name_column);
        const core::Value* type = row.find(schema_query->type_column);
        if (!name || name->is_null()) {
            continue;
        }
        ColumnInfo info;
        info.name = dialect.fold_column_label(cell_text(*name));
        info.declared_type = (type && !type->is_null()) ? cell_text(*type) : std::string();
        schema.columns.push_back(std::move(info));
    }

    if (schema.columns.empty()) {
        LOG_ERROR(std::string(core::error_kind_to_string(core::ErrorKind::SCHEMA_UNAVAILABLE)) +
                  ": no columns reported for " + physical);
        return std::nullopt;
    }

    return schema;
}

bool SchemaIntrospector::is_text_column(const ColumnInfo& column) const {
    return db_.dialect().is_text_like(column.declared_type);
}

const std::set<std::string>& text_like_types(config::Driver driver) {
    return dialect::text_like_types(driver);
}

} // namespace sqlbridge::schema
