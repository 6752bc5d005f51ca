#pragma once

#include "odbc_connection.hpp"
#include "session.hpp"
#include "value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge::core {

// RAII wrapper for an ODBC statement handle
class OdbcStatement {
public:
    explicit OdbcStatement(OdbcConnection& conn);
    ~OdbcStatement();

    // Non-copyable, non-movable (due to reference member)
    OdbcStatement(const OdbcStatement&) = delete;
    OdbcStatement& operator=(const OdbcStatement&) = delete;
    OdbcStatement(OdbcStatement&&) = delete;
    OdbcStatement& operator=(OdbcStatement&&) = delete;

    // Direct execution, no parameters
    void execute(std::string_view sql);

    // SQLPrepare + SQLBindParameter for each value + SQLExecute
    void execute(std::string_view sql, const std::vector<Value>& params);

    // Empty when the statement produced no result set
    std::vector<ColumnDescription> describe_columns();

    bool fetch();
    void close_cursor();

    // SQLGetData for one column of the current row, in as many chunks as needed.
    // Binary columns are read as raw bytes, everything else as character data.
    RawCell get_cell(SQLUSMALLINT column, bool binary);

    // SQLRowCount; -1 when the driver cannot tell
    long long row_count();

    SQLHSTMT get_handle() const noexcept { return handle_; }

private:
    // Storage that must stay put while parameters are bound
    struct ParamBuffer {
        std::string text;
        std::int64_t integer = 0;
        double real = 0.0;
        unsigned char bit = 0;
        SQLLEN indicator = 0;
    };

    void recycle() noexcept;
    void bind_parameter(SQLUSMALLINT index, const Value& value, ParamBuffer& buffer);

    SQLHSTMT handle_ = SQL_NULL_HSTMT;
    OdbcConnection& conn_;
    std::vector<ParamBuffer> param_buffers_;
};

// BINARY, VARBINARY, LONGVARBINARY
bool is_binary_sql_type(SQLSMALLINT sql_type);

} // namespace sqlbridge::core
