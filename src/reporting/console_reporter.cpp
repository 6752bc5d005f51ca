#include "console_reporter.hpp"
#include "sqlbridge/version.hpp"
#include "core/db_error.hpp"
#include <algorithm>
#include <iomanip>

namespace sqlbridge::reporting {

void ConsoleReporter::report_start(const std::string& command, const std::string& target) {
    out_ << "SQLBridge v" << SQLBRIDGE_VERSION << " - " << command << "\n";
    if (verbose_) {
        out_ << "  Target: " << target << "\n";
    }
    out_ << "\n";
}

void ConsoleReporter::report_tables(const std::vector<std::string>& tables) {
    out_ << "TABLES:\n";
    for (const auto& table : tables) {
        out_ << "  " << table << "\n";
    }
    out_ << "(" << tables.size() << " tables)\n\n";
}

void ConsoleReporter::report_schema(const schema::TableSchema& schema) {
    std::size_t name_width = 6;
    for (const auto& column : schema.columns) {
        name_width = std::max(name_width, column.name.size());
    }

    out_ << "TABLE " << schema.table << ":\n";
    out_ << "  " << std::left << std::setw(static_cast<int>(name_width)) << "Column"
         << "  Type\n";
    out_ << "  " << std::string(name_width, '-') << "  " << std::string(20, '-') << "\n";
    for (const auto& column : schema.columns) {
        out_ << "  " << std::left << std::setw(static_cast<int>(name_width)) << column.name
             << "  " << column.declared_type << "\n";
    }
    out_ << std::right << "(" << schema.columns.size() << " columns)\n\n";
}

void ConsoleReporter::report_result(const query::QueryResult& result) {
    switch (result.status()) {
        case query::QueryResult::Status::ROWS:
            print_rows(result.rows(), "  ");
            out_ << "(" << result.rows().size() << " rows)\n\n";
            break;
        case query::QueryResult::Status::NO_RESULT_SET:
            out_ << "OK";
            if (result.affected_rows() >= 0) {
                out_ << ", " << result.affected_rows() << " rows affected";
            }
            out_ << "\n\n";
            break;
        case query::QueryResult::Status::ERR:
            out_ << "[ERR!] " << core::error_kind_to_string(result.error_kind())
                 << ": " << result.error_message() << "\n";
            for (const auto& diag : result.diagnostics()) {
                out_ << "      [" << diag.sqlstate << "] (" << diag.native_error << ") "
                     << diag.message << "\n";
            }
            out_ << "\n";
            break;
    }
}

void ConsoleReporter::report_findings(const std::string& needle,
                                      const std::vector<search::SearchFinding>& findings) {
    out_ << "SEARCH \"" << needle << "\":\n";
    if (findings.empty()) {
        out_ << "  No matches\n\n";
        return;
    }

    std::size_t total_rows = 0;
    for (const auto& finding : findings) {
        out_ << "  " << finding.table_name << "." << finding.column_name
             << " (" << finding.matching_rows.size() << " rows)\n";
        if (verbose_) {
            print_rows(finding.matching_rows, "      ");
        }
        total_rows += finding.matching_rows.size();
    }
    out_ << "(" << findings.size() << " columns, " << total_rows << " rows)\n\n";
}

void ConsoleReporter::report_error(const std::string& message) {
    out_ << "[ERR!] " << message << "\n\n";
}

void ConsoleReporter::report_end() {
    out_ << std::flush;
}

void ConsoleReporter::print_rows(const std::vector<core::Row>& rows, const std::string& indent) {
    std::size_t index = 0;
    for (const auto& row : rows) {
        std::size_t label_width = 0;
        for (const auto& [column, value] : row) {
            label_width = std::max(label_width, column.size());
        }

        out_ << indent << "*** row " << ++index << " ***\n";
        for (const auto& [column, value] : row) {
            out_ << indent << std::right << std::setw(static_cast<int>(label_width)) << column
                 << ": " << value.to_string() << "\n";
        }
    }
}

} // namespace sqlbridge::reporting
