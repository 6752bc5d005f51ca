#include "result_normalizer.hpp"
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace sqlbridge::query {

namespace {

std::optional<std::int64_t> parse_integer(const std::string& text) {
    std::int64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (begin != end && *begin == '+') {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || begin == end) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_real(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parse_bit(const std::string& text) {
    if (text == "1" || text == "t" || text == "true" || text == "TRUE") return true;
    if (text == "0" || text == "f" || text == "false" || text == "FALSE") return false;
    return std::nullopt;
}

} // anonymous namespace

bool is_valid_utf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);

        std::size_t length = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > bytes.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto cont = static_cast<unsigned char>(bytes[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates, beyond U+10FFFF
        if ((length == 2 && code_point < 0x80) ||
            (length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += length;
    }
    return true;
}

ResultNormalizer::ResultNormalizer(const dialect::Dialect& dialect)
    : dialect_(dialect) {
}

std::vector<core::Row> ResultNormalizer::normalize(const core::RawResult& raw) const {
    std::vector<core::Row> rows;
    rows.reserve(raw.rows.size());
    for (const auto& cells : raw.rows) {
        rows.push_back(normalize_row(raw.columns, cells));
    }
    return rows;
}

core::Row ResultNormalizer::normalize_row(const std::vector<core::ColumnDescription>& columns,
                                          const core::RawRow& cells) const {
    core::Row row;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        core::Value value = i < cells.size() ? convert_cell(columns[i], cells[i]) : core::Value();
        row.set(dialect_.fold_column_label(columns[i].name), std::move(value));
    }
    return row;
}

core::Value ResultNormalizer::convert_cell(const core::ColumnDescription& column, const core::RawCell& cell) {
    if (!cell) {
        return core::Value();
    }
    const std::string& text = *cell;

    switch (column.sql_type) {
        case SQL_BINARY:
        case SQL_VARBINARY:
        case SQL_LONGVARBINARY:
            if (is_valid_utf8(text)) {
                return core::Value(text);
            }
            return core::Value(std::string(UNDECODABLE_BINARY));

        case SQL_BIT:
            if (auto bit = parse_bit(text)) {
                return core::Value(*bit);
            }
            break;

        case SQL_TINYINT:
        case SQL_SMALLINT:
        case SQL_INTEGER:
        case SQL_BIGINT:
            if (auto integer = parse_integer(text)) {
                return core::Value(*integer);
            }
            break;

        case SQL_REAL:
        case SQL_FLOAT:
        case SQL_DOUBLE:
            if (auto real = parse_real(text)) {
                return core::Value(*real);
            }
            break;

        case SQL_DECIMAL:
        case SQL_NUMERIC:
            // Exact decimals with a fraction stay text to keep every digit
            if (column.decimal_digits == 0) {
                if (auto integer = parse_integer(text)) {
                    return core::Value(*integer);
                }
            }
            break;

        default:
            break;
    }

    return core::Value(text);
}

} // namespace sqlbridge::query
