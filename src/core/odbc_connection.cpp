#include "odbc_connection.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace sqlbridge::core {

OdbcConnection::OdbcConnection(OdbcEnvironment& env)
    : env_(env) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, env_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, env_.get_handle(), "SQLAllocHandle(DBC)");
}

OdbcConnection::~OdbcConnection() {
    if (connected_) {
        try {
            disconnect();
        } catch (const OdbcError& e) {
            LOG_WARN(std::string("Disconnect during teardown failed: ") + e.what());
        }
    }

    if (handle_ != SQL_NULL_HDBC) {
        SQLFreeHandle(SQL_HANDLE_DBC, handle_);
    }
}

void OdbcConnection::connect(std::string_view connection_string, int login_timeout_seconds) {
    if (connected_) {
        throw OdbcError("Already connected");
    }

    if (login_timeout_seconds > 0) {
        // Advisory: drivers that do not support it return SQLSTATE HYC00
        SQLRETURN ret = SQLSetConnectAttr(handle_, SQL_ATTR_LOGIN_TIMEOUT,
                                          (SQLPOINTER)(SQLULEN)login_timeout_seconds, 0);
        LOG_IF(!SQL_SUCCEEDED(ret), "Driver rejected SQL_ATTR_LOGIN_TIMEOUT", "Login timeout set");
    }

    SQLCHAR out_conn_str[1024];
    SQLSMALLINT out_conn_str_len = 0;

    SQLRETURN ret = SQLDriverConnect(
        handle_,
        nullptr,
        (SQLCHAR*)connection_string.data(),
        static_cast<SQLSMALLINT>(connection_string.length()),
        out_conn_str,
        sizeof(out_conn_str),
        &out_conn_str_len,
        SQL_DRIVER_NOPROMPT
    );

    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDriverConnect");
    connected_ = true;

    ret = SQLSetConnectAttr(handle_, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER)SQL_AUTOCOMMIT_ON, 0);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLSetConnectAttr(AUTOCOMMIT)");
}

void OdbcConnection::disconnect() {
    if (!connected_) {
        return;
    }

    // The handle is unusable either way, so the flag drops before the check
    connected_ = false;
    SQLRETURN ret = SQLDisconnect(handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDisconnect");
}

bool OdbcConnection::is_alive() const {
    if (!connected_) {
        return false;
    }

    SQLUINTEGER dead = SQL_CD_FALSE;
    SQLRETURN ret = SQLGetConnectAttr(handle_, SQL_ATTR_CONNECTION_DEAD, &dead, 0, nullptr);
    if (!SQL_SUCCEEDED(ret)) {
        // Drivers without SQL_ATTR_CONNECTION_DEAD: trust the connected flag
        return true;
    }
    return dead == SQL_CD_FALSE;
}

void OdbcConnection::commit() {
    SQLRETURN ret = SQLEndTran(SQL_HANDLE_DBC, handle_, SQL_COMMIT);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLEndTran(COMMIT)");
}

std::string OdbcConnection::dbms_name() const {
    return get_info_string(SQL_DBMS_NAME);
}

std::string OdbcConnection::dbms_version() const {
    return get_info_string(SQL_DBMS_VER);
}

std::string OdbcConnection::get_info_string(SQLUSMALLINT info_type) const {
    SQLCHAR buffer[256] = {0};
    SQLSMALLINT length = 0;

    SQLRETURN ret = SQLGetInfo(handle_, info_type, buffer, sizeof(buffer), &length);
    if (!SQL_SUCCEEDED(ret)) {
        return {};
    }
    return std::string(reinterpret_cast<char*>(buffer));
}

} // namespace sqlbridge::core
