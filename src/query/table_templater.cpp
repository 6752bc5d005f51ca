#include "table_templater.hpp"
#include <algorithm>
#include <optional>

namespace sqlbridge::query {

namespace {

struct Placeholder {
    std::size_t length;     // characters consumed, braces included
    std::string_view name;
};

bool is_name_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

// Matches `braces` opening braces, a name, and as many closing braces at pos.
// Only called at the start of a brace run.
std::optional<Placeholder> match_braced_name(std::string_view query, std::size_t pos, std::size_t braces) {
    if (query.compare(pos, braces, std::string(braces, '{')) != 0) {
        return std::nullopt;
    }

    std::size_t name_start = pos + braces;
    std::size_t name_end = name_start;
    while (name_end < query.size() && is_name_char(query[name_end])) {
        ++name_end;
    }
    if (name_end == name_start) {
        return std::nullopt;
    }
    if (query.compare(name_end, braces, std::string(braces, '}')) != 0) {
        return std::nullopt;
    }
    // Unbalanced runs such as {node}} stay verbatim
    if (name_end + braces < query.size() && query[name_end + braces] == '}') {
        return std::nullopt;
    }

    return Placeholder{name_end + braces - pos, query.substr(name_start, name_end - name_start)};
}

std::optional<Placeholder> placeholder_at(std::string_view query, std::size_t pos) {
    if (auto triple = match_braced_name(query, pos, 3)) {
        return triple;
    }
    return match_braced_name(query, pos, 1);
}

// Calls on_char for plain characters and on_placeholder for each placeholder
template <typename OnChar, typename OnPlaceholder>
void scan(std::string_view query, const dialect::LexicalRules& rules,
          OnChar on_char, OnPlaceholder on_placeholder) {
    bool in_literal = false;
    std::size_t pos = 0;

    while (pos < query.size()) {
        char c = query[pos];

        if (in_literal && c == '\\' && rules.backslash_escapes && pos + 1 < query.size()) {
            on_char(c);
            on_char(query[pos + 1]);
            pos += 2;
            continue;
        }

        if (c == '\'') {
            // '' inside a literal toggles out and straight back in
            in_literal = !in_literal;
        } else if (!in_literal && c == '{' && (pos == 0 || query[pos - 1] != '{')) {
            if (auto placeholder = placeholder_at(query, pos)) {
                on_placeholder(placeholder->name);
                pos += placeholder->length;
                continue;
            }
        }

        on_char(c);
        ++pos;
    }
}

} // anonymous namespace

TableTemplater::TableTemplater(std::string prefix, dialect::LexicalRules rules)
    : prefix_(std::move(prefix)), rules_(rules) {
}

std::string TableTemplater::prepare(std::string_view query) const {
    std::string result;
    result.reserve(query.size() + 32);

    scan(query, rules_,
         [&result](char c) { result += c; },
         [&result, this](std::string_view name) {
             result += prefix_;
             result.append(name.data(), name.size());
         });

    return result;
}

std::string TableTemplater::physical_name(std::string_view logical) const {
    return prefix_ + std::string(logical);
}

std::vector<std::string> TableTemplater::placeholders(std::string_view query) const {
    std::vector<std::string> names;

    scan(query, rules_,
         [](char) {},
         [&names](std::string_view name) {
             if (std::find(names.begin(), names.end(), name) == names.end()) {
                 names.emplace_back(name);
             }
         });

    return names;
}

} // namespace sqlbridge::query
