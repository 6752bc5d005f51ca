#pragma once

#include "query/db_manager.hpp"
#include "core/value.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge::search {

// Rows of one text-like column that contain the needle
struct SearchFinding {
    std::string table_name;     // logical name
    std::string column_name;
    std::vector<core::Row> matching_rows;
};

/**
 * @brief Substring search over every text-like column of every table
 *
 * One bounded LIKE query per column. A table or column that fails is logged
 * and skipped; the scan always runs to the end.
 */
class TableSearch {
public:
    explicit TableSearch(query::DbManager& db);

    // Findings ordered by table name, then by column in schema order.
    // A non-positive limit yields no findings.
    std::vector<SearchFinding> search_all_tables(std::string_view needle, int row_limit_per_column);

private:
    query::DbManager& db_;
};

} // namespace sqlbridge::search
