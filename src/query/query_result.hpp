#pragma once

#include "core/db_error.hpp"
#include "core/value.hpp"
#include <string>
#include <vector>

namespace sqlbridge::query {

// Outcome of one statement: rows (possibly none), no result set, or an error
class QueryResult {
public:
    enum class Status {
        ROWS,           // statement produced a result set
        NO_RESULT_SET,  // INSERT/UPDATE/DELETE/DDL, committed
        ERR
    };

    static QueryResult with_rows(std::vector<core::Row> rows);
    static QueryResult no_result_set(long long affected_rows);
    static QueryResult error(core::ErrorKind kind, std::string message,
                             std::vector<core::OdbcDiagnostic> diagnostics = {});

    Status status() const noexcept { return status_; }
    bool ok() const noexcept { return status_ != Status::ERR; }
    bool has_rows() const noexcept { return status_ == Status::ROWS && !rows_.empty(); }
    explicit operator bool() const noexcept { return ok(); }

    const std::vector<core::Row>& rows() const noexcept { return rows_; }
    std::vector<core::Row>& rows() noexcept { return rows_; }

    // First row, or nullptr when there is none (fetch-one lookups)
    const core::Row* first() const noexcept;

    // -1 unless status() == NO_RESULT_SET and the driver reported a count
    long long affected_rows() const noexcept { return affected_rows_; }

    // Meaningful only when status() == ERR
    core::ErrorKind error_kind() const noexcept { return error_kind_; }
    const std::string& error_message() const noexcept { return error_message_; }
    const std::vector<core::OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

private:
    QueryResult() = default;

    Status status_ = Status::ROWS;
    std::vector<core::Row> rows_;
    long long affected_rows_ = -1;
    core::ErrorKind error_kind_ = core::ErrorKind::QUERY_FAILURE;
    std::string error_message_;
    std::vector<core::OdbcDiagnostic> diagnostics_;
};

const char* status_to_string(QueryResult::Status status);

} // namespace sqlbridge::query
