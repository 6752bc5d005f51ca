#pragma once

#include "core/session.hpp"
#include "core/value.hpp"
#include "dialect/dialect.hpp"
#include <string_view>
#include <vector>

namespace sqlbridge::query {

// Replaces binary cells that are not valid UTF-8
constexpr std::string_view UNDECODABLE_BINARY = "[undecodable binary data]";

// Turns positional raw results into column-keyed rows for one dialect
class ResultNormalizer {
public:
    explicit ResultNormalizer(const dialect::Dialect& dialect);

    std::vector<core::Row> normalize(const core::RawResult& raw) const;

    core::Row normalize_row(const std::vector<core::ColumnDescription>& columns,
                            const core::RawRow& cells) const;

    // Typed value for one cell, by the column's ODBC SQL type
    static core::Value convert_cell(const core::ColumnDescription& column, const core::RawCell& cell);

private:
    const dialect::Dialect& dialect_;
};

bool is_valid_utf8(std::string_view bytes);

} // namespace sqlbridge::query
