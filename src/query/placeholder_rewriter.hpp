#pragma once

#include "dialect/dialect.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace sqlbridge::query {

struct RewrittenQuery {
    std::string sql;
    std::size_t marker_count = 0;
};

/**
 * @brief Normalizes parameter markers to the ODBC '?' marker
 *
 * Callers write '?' for every engine; the format-style '%s' is accepted as an
 * alias. Markers inside string literals, quoted identifiers ("..", `..`) and
 * comments (-- and block comments) are left alone and not counted. [..] is an
 * identifier only under rules.bracket_identifiers; elsewhere it is an array
 * constructor or subscript whose markers count.
 */
RewrittenQuery rewrite_placeholders(std::string_view sql, const dialect::LexicalRules& rules = {});

} // namespace sqlbridge::query
