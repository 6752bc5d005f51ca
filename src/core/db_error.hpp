#pragma once

#include "odbc_error.hpp"
#include <string>
#include <vector>
#include <stdexcept>

namespace sqlbridge::core {

// Failure categories of the access layer
enum class ErrorKind {
    CONFIG_INCOMPLETE,
    UNSUPPORTED_DRIVER,
    CONNECTION_FAILURE,
    QUERY_FAILURE,
    SCHEMA_UNAVAILABLE,
    UNSAFE_IDENTIFIER
};

const char* error_kind_to_string(ErrorKind kind);

// Raised for failures that must reach the caller (construction, configuration)
class DbError : public std::runtime_error {
public:
    DbError(ErrorKind kind, const std::string& message);
    DbError(ErrorKind kind, const std::string& message, std::vector<OdbcDiagnostic> diagnostics);

    ErrorKind kind() const noexcept { return kind_; }
    const std::vector<OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

private:
    ErrorKind kind_;
    std::vector<OdbcDiagnostic> diagnostics_;
};

} // namespace sqlbridge::core
