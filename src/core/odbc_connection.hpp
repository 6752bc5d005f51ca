#pragma once

#include "odbc_environment.hpp"
#include <string>
#include <string_view>

namespace sqlbridge::core {

// RAII wrapper for an ODBC connection handle
class OdbcConnection {
public:
    explicit OdbcConnection(OdbcEnvironment& env);
    ~OdbcConnection();

    // Non-copyable, non-movable (due to reference member)
    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;
    OdbcConnection(OdbcConnection&&) = delete;
    OdbcConnection& operator=(OdbcConnection&&) = delete;

    // Connects without prompting; autocommit is switched on afterwards
    void connect(std::string_view connection_string, int login_timeout_seconds = 0);
    void disconnect();
    bool is_connected() const noexcept { return connected_; }

    // False once the driver reports the link as dead (SQL_ATTR_CONNECTION_DEAD)
    bool is_alive() const;

    void commit();

    // SQLGetInfo(SQL_DBMS_NAME) / SQL_DBMS_VER; empty when the driver does not say
    std::string dbms_name() const;
    std::string dbms_version() const;

    SQLHDBC get_handle() const noexcept { return handle_; }

private:
    std::string get_info_string(SQLUSMALLINT info_type) const;

    SQLHDBC handle_ = SQL_NULL_HDBC;
    OdbcEnvironment& env_;
    bool connected_ = false;
};

} // namespace sqlbridge::core
