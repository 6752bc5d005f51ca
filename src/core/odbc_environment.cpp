#include "odbc_environment.hpp"
#include "odbc_error.hpp"
#include <algorithm>
#include <cctype>

namespace sqlbridge::core {

OdbcEnvironment::OdbcEnvironment() {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "SQLAllocHandle(ENV)");

    ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
    if (!SQL_SUCCEEDED(ret)) {
        OdbcError error = OdbcError::from_handle(SQL_HANDLE_ENV, handle_, "SQLSetEnvAttr(ODBC_VERSION)");
        release();
        throw error;
    }
}

OdbcEnvironment::~OdbcEnvironment() {
    release();
}

OdbcEnvironment::OdbcEnvironment(OdbcEnvironment&& other) noexcept
    : handle_(other.handle_) {
    other.handle_ = SQL_NULL_HENV;
}

OdbcEnvironment& OdbcEnvironment::operator=(OdbcEnvironment&& other) noexcept {
    if (this != &other) {
        release();
        handle_ = other.handle_;
        other.handle_ = SQL_NULL_HENV;
    }
    return *this;
}

void OdbcEnvironment::release() noexcept {
    if (handle_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
        handle_ = SQL_NULL_HENV;
    }
}

std::vector<std::string> OdbcEnvironment::installed_drivers() const {
    std::vector<std::string> drivers;

    SQLCHAR description[256] = {0};
    SQLCHAR attributes[1024] = {0};
    SQLSMALLINT description_len = 0;
    SQLSMALLINT attributes_len = 0;

    SQLUSMALLINT direction = SQL_FETCH_FIRST;
    while (SQL_SUCCEEDED(SQLDrivers(handle_, direction,
                                    description, sizeof(description), &description_len,
                                    attributes, sizeof(attributes), &attributes_len))) {
        drivers.emplace_back(reinterpret_cast<char*>(description));
        direction = SQL_FETCH_NEXT;
    }

    return drivers;
}

bool OdbcEnvironment::has_driver(std::string_view name) const {
    auto equals_ignore_case = [name](const std::string& candidate) {
        return candidate.size() == name.size() &&
               std::equal(candidate.begin(), candidate.end(), name.begin(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    auto drivers = installed_drivers();
    return std::any_of(drivers.begin(), drivers.end(), equals_ignore_case);
}

} // namespace sqlbridge::core
