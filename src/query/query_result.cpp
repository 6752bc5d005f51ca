#include "query_result.hpp"

namespace sqlbridge::query {

QueryResult QueryResult::with_rows(std::vector<core::Row> rows) {
    QueryResult result;
    result.status_ = Status::ROWS;
    result.rows_ = std::move(rows);
    return result;
}

QueryResult QueryResult::no_result_set(long long affected_rows) {
    QueryResult result;
    result.status_ = Status::NO_RESULT_SET;
    result.affected_rows_ = affected_rows;
    return result;
}

QueryResult QueryResult::error(core::ErrorKind kind, std::string message,
                               std::vector<core::OdbcDiagnostic> diagnostics) {
    QueryResult result;
    result.status_ = Status::ERR;
    result.error_kind_ = kind;
    result.error_message_ = std::move(message);
    result.diagnostics_ = std::move(diagnostics);
    return result;
}

const core::Row* QueryResult::first() const noexcept {
    if (status_ != Status::ROWS || rows_.empty()) {
        return nullptr;
    }
    return &rows_.front();
}

const char* status_to_string(QueryResult::Status status) {
    switch (status) {
        case QueryResult::Status::ROWS: return "ROWS";
        case QueryResult::Status::NO_RESULT_SET: return "NO_RESULT_SET";
        case QueryResult::Status::ERR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace sqlbridge::query
