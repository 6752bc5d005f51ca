#include "placeholder_rewriter.hpp"

namespace sqlbridge::query {

namespace {

enum class ScanState {
    CODE,
    SINGLE_QUOTED,
    DOUBLE_QUOTED,
    BACKTICK_QUOTED,
    BRACKET_QUOTED,
    LINE_COMMENT,
    BLOCK_COMMENT
};

} // anonymous namespace

RewrittenQuery rewrite_placeholders(std::string_view sql, const dialect::LexicalRules& rules) {
    RewrittenQuery result;
    result.sql.reserve(sql.size());

    ScanState state = ScanState::CODE;

    for (std::size_t i = 0; i < sql.size(); ++i) {
        const char c = sql[i];
        const char next = i + 1 < sql.size() ? sql[i + 1] : '\0';

        switch (state) {
            case ScanState::CODE:
                if (c == '?') {
                    ++result.marker_count;
                } else if (c == '%' && next == 's') {
                    result.sql += '?';
                    ++result.marker_count;
                    ++i;
                    continue;
                } else if (c == '\'') {
                    state = ScanState::SINGLE_QUOTED;
                } else if (c == '"') {
                    state = ScanState::DOUBLE_QUOTED;
                } else if (c == '`') {
                    state = ScanState::BACKTICK_QUOTED;
                } else if (c == '[' && rules.bracket_identifiers) {
                    state = ScanState::BRACKET_QUOTED;
                } else if (c == '-' && next == '-') {
                    state = ScanState::LINE_COMMENT;
                } else if (c == '/' && next == '*') {
                    result.sql += "/*";
                    ++i;
                    state = ScanState::BLOCK_COMMENT;
                    continue;
                }
                break;
            // Doubled closing quotes re-enter the same state on the next character
            case ScanState::SINGLE_QUOTED:
            case ScanState::DOUBLE_QUOTED:
                if (c == '\\' && rules.backslash_escapes && i + 1 < sql.size()) {
                    result.sql += c;
                    result.sql += next;
                    ++i;
                    continue;
                }
                if (c == (state == ScanState::SINGLE_QUOTED ? '\'' : '"')) state = ScanState::CODE;
                break;
            case ScanState::BACKTICK_QUOTED:
                if (c == '`') state = ScanState::CODE;
                break;
            case ScanState::BRACKET_QUOTED:
                if (c == ']') state = ScanState::CODE;
                break;
            case ScanState::LINE_COMMENT:
                if (c == '\n') state = ScanState::CODE;
                break;
            case ScanState::BLOCK_COMMENT:
                if (c == '*' && next == '/') {
                    result.sql += "*/";
                    ++i;
                    state = ScanState::CODE;
                    continue;
                }
                break;
        }

        result.sql += c;
    }

    return result;
}

} // namespace sqlbridge::query
