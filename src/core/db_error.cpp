#include "db_error.hpp"

namespace sqlbridge::core {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIG_INCOMPLETE: return "ConfigIncomplete";
        case ErrorKind::UNSUPPORTED_DRIVER: return "UnsupportedDriver";
        case ErrorKind::CONNECTION_FAILURE: return "ConnectionFailure";
        case ErrorKind::QUERY_FAILURE: return "QueryFailure";
        case ErrorKind::SCHEMA_UNAVAILABLE: return "SchemaUnavailable";
        case ErrorKind::UNSAFE_IDENTIFIER: return "UnsafeIdentifier";
        default: return "Unknown";
    }
}

DbError::DbError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {
}

DbError::DbError(ErrorKind kind, const std::string& message, std::vector<OdbcDiagnostic> diagnostics)
    : std::runtime_error(message), kind_(kind), diagnostics_(std::move(diagnostics)) {
}

} // namespace sqlbridge::core
