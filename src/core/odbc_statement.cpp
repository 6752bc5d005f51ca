#include "odbc_statement.hpp"
#include "odbc_error.hpp"

namespace sqlbridge::core {

namespace {

constexpr SQLULEN LONG_TEXT_THRESHOLD = 4000;
constexpr std::size_t FETCH_CHUNK_SIZE = 8192;

} // anonymous namespace

bool is_binary_sql_type(SQLSMALLINT sql_type) {
    return sql_type == SQL_BINARY || sql_type == SQL_VARBINARY || sql_type == SQL_LONGVARBINARY;
}

OdbcStatement::OdbcStatement(OdbcConnection& conn)
    : conn_(conn) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, conn_.get_handle(), "SQLAllocHandle(STMT)");
}

OdbcStatement::~OdbcStatement() {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLFreeHandle(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::recycle() noexcept {
    // SQL_CLOSE succeeds even when no cursor is open, unlike SQLCloseCursor
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLFreeStmt(handle_, SQL_RESET_PARAMS);
    param_buffers_.clear();
}

void OdbcStatement::execute(std::string_view sql) {
    recycle();
    SQLRETURN ret = SQLExecDirect(handle_, (SQLCHAR*)sql.data(), static_cast<SQLINTEGER>(sql.length()));
    // UPDATE/DELETE touching no rows report SQL_NO_DATA
    if (ret != SQL_NO_DATA) {
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecDirect");
    }
}

void OdbcStatement::execute(std::string_view sql, const std::vector<Value>& params) {
    if (params.empty()) {
        execute(sql);
        return;
    }

    recycle();
    SQLRETURN ret = SQLPrepare(handle_, (SQLCHAR*)sql.data(), static_cast<SQLINTEGER>(sql.length()));
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLPrepare");

    // Sized once so bound addresses stay valid until SQLExecute
    param_buffers_.resize(params.size());
    for (std::size_t i = 0; i < params.size(); ++i) {
        bind_parameter(static_cast<SQLUSMALLINT>(i + 1), params[i], param_buffers_[i]);
    }

    ret = SQLExecute(handle_);
    if (ret != SQL_NO_DATA) {
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecute");
    }
}

void OdbcStatement::bind_parameter(SQLUSMALLINT index, const Value& value, ParamBuffer& buffer) {
    SQLRETURN ret = SQL_ERROR;

    switch (value.type()) {
        case Value::Type::NUL:
            buffer.indicator = SQL_NULL_DATA;
            ret = SQLBindParameter(handle_, index, SQL_PARAM_INPUT, SQL_C_CHAR, SQL_VARCHAR,
                                   1, 0, nullptr, 0, &buffer.indicator);
            break;
        case Value::Type::BOOLEAN:
            buffer.bit = value.as_bool() ? 1 : 0;
            buffer.indicator = 0;
            ret = SQLBindParameter(handle_, index, SQL_PARAM_INPUT, SQL_C_BIT, SQL_BIT,
                                   1, 0, &buffer.bit, 0, &buffer.indicator);
            break;
        case Value::Type::INTEGER:
            buffer.integer = value.as_integer();
            buffer.indicator = 0;
            ret = SQLBindParameter(handle_, index, SQL_PARAM_INPUT, SQL_C_SBIGINT, SQL_BIGINT,
                                   19, 0, &buffer.integer, 0, &buffer.indicator);
            break;
        case Value::Type::REAL:
            buffer.real = value.as_real();
            buffer.indicator = 0;
            ret = SQLBindParameter(handle_, index, SQL_PARAM_INPUT, SQL_C_DOUBLE, SQL_DOUBLE,
                                   15, 0, &buffer.real, 0, &buffer.indicator);
            break;
        case Value::Type::TEXT: {
            buffer.text = value.as_text();
            buffer.indicator = static_cast<SQLLEN>(buffer.text.size());
            SQLULEN column_size = buffer.text.empty() ? 1 : buffer.text.size();
            SQLSMALLINT sql_type = column_size > LONG_TEXT_THRESHOLD ? SQL_LONGVARCHAR : SQL_VARCHAR;
            ret = SQLBindParameter(handle_, index, SQL_PARAM_INPUT, SQL_C_CHAR, sql_type,
                                   column_size, 0, (SQLPOINTER)buffer.text.data(),
                                   static_cast<SQLLEN>(buffer.text.size()), &buffer.indicator);
            break;
        }
    }

    check_odbc_result(ret, SQL_HANDLE_STMT, handle_,
                      "SQLBindParameter(" + std::to_string(index) + ")");
}

std::vector<ColumnDescription> OdbcStatement::describe_columns() {
    std::vector<ColumnDescription> columns;

    SQLSMALLINT count = 0;
    SQLRETURN ret = SQLNumResultCols(handle_, &count);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLNumResultCols");

    columns.reserve(count);
    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(count); ++i) {
        SQLCHAR name[256] = {0};
        SQLSMALLINT name_len = 0;
        ColumnDescription col;
        SQLSMALLINT nullable = SQL_NULLABLE_UNKNOWN;

        ret = SQLDescribeCol(handle_, i, name, sizeof(name), &name_len,
                             &col.sql_type, &col.column_size, &col.decimal_digits, &nullable);
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLDescribeCol");

        col.name = reinterpret_cast<char*>(name);
        col.nullable = nullable != SQL_NO_NULLS;
        columns.push_back(std::move(col));
    }

    return columns;
}

bool OdbcStatement::fetch() {
    SQLRETURN ret = SQLFetch(handle_);

    if (ret == SQL_NO_DATA) {
        return false;
    }

    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFetch");
    return true;
}

void OdbcStatement::close_cursor() {
    SQLFreeStmt(handle_, SQL_CLOSE);
}

RawCell OdbcStatement::get_cell(SQLUSMALLINT column, bool binary) {
    const SQLSMALLINT c_type = binary ? SQL_C_BINARY : SQL_C_CHAR;
    // Character data is null-terminated inside the buffer, binary data is not
    const std::size_t usable = binary ? FETCH_CHUNK_SIZE : FETCH_CHUNK_SIZE - 1;

    std::string data;
    char buffer[FETCH_CHUNK_SIZE];

    for (;;) {
        SQLLEN indicator = 0;
        SQLRETURN ret = SQLGetData(handle_, column, c_type, buffer, sizeof(buffer), &indicator);

        if (ret == SQL_NO_DATA) {
            break;  // previous call returned the last chunk
        }
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_,
                          "SQLGetData(column " + std::to_string(column) + ")");

        if (indicator == SQL_NULL_DATA) {
            return std::nullopt;
        }

        bool truncated = indicator == SQL_NO_TOTAL || indicator > static_cast<SQLLEN>(usable);
        if (truncated) {
            data.append(buffer, usable);
            continue;
        }

        data.append(buffer, static_cast<std::size_t>(indicator));
        break;
    }

    return data;
}

long long OdbcStatement::row_count() {
    SQLLEN count = -1;
    SQLRETURN ret = SQLRowCount(handle_, &count);
    if (!SQL_SUCCEEDED(ret)) {
        return -1;
    }
    return static_cast<long long>(count);
}

} // namespace sqlbridge::core
