#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge::core {

// RAII wrapper for the ODBC environment handle (ODBC 3.x behaviour)
class OdbcEnvironment {
public:
    OdbcEnvironment();
    ~OdbcEnvironment();

    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;

    OdbcEnvironment(OdbcEnvironment&& other) noexcept;
    OdbcEnvironment& operator=(OdbcEnvironment&& other) noexcept;

    SQLHENV get_handle() const noexcept { return handle_; }

    // Driver descriptions registered with the driver manager (odbcinst.ini)
    std::vector<std::string> installed_drivers() const;

    // Case-insensitive lookup in installed_drivers()
    bool has_driver(std::string_view name) const;

private:
    void release() noexcept;

    SQLHENV handle_ = SQL_NULL_HENV;
};

} // namespace sqlbridge::core
