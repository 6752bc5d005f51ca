#pragma once

#include "value.hpp"

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge::core {

// Column metadata as reported by SQLDescribeCol
struct ColumnDescription {
    std::string name;
    SQLSMALLINT sql_type = SQL_VARCHAR;
    SQLULEN column_size = 0;
    SQLSMALLINT decimal_digits = 0;
    bool nullable = true;
};

// One fetched cell: character data for text-like types, raw bytes for binary
// types, std::nullopt for SQL NULL
using RawCell = std::optional<std::string>;
using RawRow = std::vector<RawCell>;

// Native fetch output, positional and untyped
struct RawResult {
    bool has_result_set = false;
    std::vector<ColumnDescription> columns;
    std::vector<RawRow> rows;
    long long affected_rows = -1;   // SQLRowCount; -1 when unknown
};

enum class FetchMode {
    ONE,
    ALL
};

// A live driver session: one connection and one statement.
// Failures are reported by throwing OdbcError.
class Session {
public:
    virtual ~Session() = default;

    virtual void open(const std::string& connection_string, int login_timeout_seconds) = 0;

    // Releases statement then connection; idempotent
    virtual void close() noexcept = 0;

    // False when never opened, closed, or the driver reports the link dead
    virtual bool is_open() const = 0;

    // Executes with '?' markers bound positionally to params
    virtual RawResult execute(std::string_view sql, const std::vector<Value>& params, FetchMode mode) = 0;

    virtual void commit() = 0;
};

} // namespace sqlbridge::core
