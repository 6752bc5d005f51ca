#pragma once

#include "dialect/dialect.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge::query {

/**
 * @brief Expands {logical_table} placeholders into prefixed physical names
 *
 * Single pass over the text:
 *   {name}        -> prefix + name      (name is [A-Za-z0-9_]+)
 *   {{{name}}}    -> prefix + name      (placeholder escaped one level deeper,
 *                                        used for names built at call time)
 *   '...{x}...'   -> unchanged          (single-quoted literals, '' escapes,
 *                                        and \' when rules.backslash_escapes)
 * Any other brace sequence is copied verbatim. Expanded names carry no braces,
 * so prepare() is idempotent.
 */
class TableTemplater {
public:
    explicit TableTemplater(std::string prefix = "", dialect::LexicalRules rules = {});

    const std::string& prefix() const noexcept { return prefix_; }

    std::string prepare(std::string_view query) const;

    std::string physical_name(std::string_view logical) const;

    // Distinct logical names referenced by placeholders, in order of appearance
    std::vector<std::string> placeholders(std::string_view query) const;

private:
    std::string prefix_;
    dialect::LexicalRules rules_;
};

} // namespace sqlbridge::query
