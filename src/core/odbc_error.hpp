#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace sqlbridge::core {

// Diagnostic record from SQLGetDiagRec
struct OdbcDiagnostic {
    std::string sqlstate;           // 5-character SQLSTATE code
    SQLINTEGER native_error = 0;    // Driver-specific error code
    std::string message;
    SQLSMALLINT record_number = 0;
};

// Exception class for ODBC errors
class OdbcError : public std::runtime_error {
public:
    // Extract all diagnostic records from a handle
    static OdbcError from_handle(SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context = "");

    explicit OdbcError(const std::string& message);
    OdbcError(const std::string& message, std::vector<OdbcDiagnostic> diagnostics);

    const std::vector<OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

    // SQLSTATE of the first record, empty when the driver gave none
    std::string sqlstate() const;

    // Class 08: the link to the server is gone and the session must be reopened
    bool is_connection_error() const;

    std::string format_diagnostics() const;

private:
    std::vector<OdbcDiagnostic> diagnostics_;
};

// Check ODBC return code and throw on error
void check_odbc_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context);

} // namespace sqlbridge::core
