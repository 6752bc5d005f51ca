#include "table_search.hpp"
#include "schema/schema_introspector.hpp"
#include "core/logger.hpp"

namespace sqlbridge::search {

TableSearch::TableSearch(query::DbManager& db)
    : db_(db) {
}

std::vector<SearchFinding> TableSearch::search_all_tables(std::string_view needle, int row_limit_per_column) {
    std::vector<SearchFinding> findings;

    if (row_limit_per_column <= 0) {
        LOG_ERROR("Search row limit must be positive, got " + std::to_string(row_limit_per_column));
        return findings;
    }

    schema::SchemaIntrospector introspector(db_);
    auto tables = introspector.list_tables();
    if (!tables) {
        LOG_WARN("Search aborted: table list unavailable");
        return findings;
    }

    const dialect::Dialect& dialect = db_.dialect();
    const std::string pattern = "%" + dialect.escape_like(needle) + "%";
    int queries = 0;

    for (const auto& table : *tables) {
        auto table_schema = introspector.get_table_schema(table);
        if (!table_schema) {
            LOG_WARN("Skipping table " + table + ": schema unavailable");
            continue;
        }

        const std::string physical = db_.physical_table_name(table);

        for (const auto& column : table_schema->columns) {
            if (!introspector.is_text_column(column)) {
                continue;
            }

            ++queries;
            query::QueryResult result = db_.execute(
                dialect.text_search_query(physical, column.name, pattern, row_limit_per_column));

            if (!result.ok()) {
                LOG_WARN("Skipping " + table + "." + column.name + ": " + result.error_message());
                continue;
            }

            if (result.has_rows()) {
                LOG_DEBUG("Match in " + table + "." + column.name + " (" +
                          std::to_string(result.rows().size()) + " rows)");
                findings.push_back({table, column.name, std::move(result.rows())});
            }
        }
    }

    LOG_INFO("Search for '" + std::string(needle) + "' ran " + std::to_string(queries) +
             " queries over " + std::to_string(tables->size()) + " tables, " +
             std::to_string(findings.size()) + " columns matched");
    return findings;
}

} // namespace sqlbridge::search
