#include "json_reporter.hpp"
#include "sqlbridge/version.hpp"
#include "core/db_error.hpp"
#include <ctime>
#include <iostream>

namespace sqlbridge::core {

void to_json(nlohmann::json& j, const Value& value) {
    switch (value.type()) {
        case Value::Type::NUL: j = nullptr; break;
        case Value::Type::BOOLEAN: j = value.as_bool(); break;
        case Value::Type::INTEGER: j = value.as_integer(); break;
        case Value::Type::REAL: j = value.as_real(); break;
        case Value::Type::TEXT: j = value.as_text(); break;
    }
}

void to_json(nlohmann::json& j, const Row& row) {
    j = nlohmann::json::object();
    for (const auto& [column, value] : row) {
        j[column] = value;
    }
}

void to_json(nlohmann::json& j, const OdbcDiagnostic& diag) {
    j = nlohmann::json{
        {"sqlstate", diag.sqlstate},
        {"native_error", diag.native_error},
        {"message", diag.message}
    };
}

} // namespace sqlbridge::core

namespace sqlbridge::reporting {

void JsonReporter::report_start(const std::string& command, const std::string& target) {
    root_ = nlohmann::json::object();
    root_["version"] = SQLBRIDGE_VERSION;
    root_["command"] = command;
    root_["target"] = target;
    root_["timestamp"] = std::time(nullptr);
}

void JsonReporter::report_tables(const std::vector<std::string>& tables) {
    root_["tables"] = tables;
}

void JsonReporter::report_schema(const schema::TableSchema& schema) {
    nlohmann::json columns = nlohmann::json::array();
    for (const auto& column : schema.columns) {
        columns.push_back({{"name", column.name}, {"type", column.declared_type}});
    }
    root_["schema"] = {{"table", schema.table}, {"columns", columns}};
}

void JsonReporter::report_result(const query::QueryResult& result) {
    nlohmann::json out;
    out["status"] = query::status_to_string(result.status());

    switch (result.status()) {
        case query::QueryResult::Status::ROWS:
            out["rows"] = result.rows();
            break;
        case query::QueryResult::Status::NO_RESULT_SET:
            out["affected_rows"] = result.affected_rows();
            break;
        case query::QueryResult::Status::ERR:
            out["error_kind"] = core::error_kind_to_string(result.error_kind());
            out["error"] = result.error_message();
            if (!result.diagnostics().empty()) {
                out["diagnostics"] = result.diagnostics();
            }
            break;
    }

    root_["result"] = out;
}

void JsonReporter::report_findings(const std::string& needle,
                                   const std::vector<search::SearchFinding>& findings) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& finding : findings) {
        array.push_back({
            {"table_name", finding.table_name},
            {"column_name", finding.column_name},
            {"matching_rows", finding.matching_rows}
        });
    }
    root_["needle"] = needle;
    root_["findings"] = array;
}

void JsonReporter::report_error(const std::string& message) {
    root_["error"] = message;
}

std::string JsonReporter::dump() const {
    return root_.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

void JsonReporter::report_end() {
    if (output_file_.empty()) {
        // Print to stdout
        std::cout << dump() << std::endl;
    } else {
        // Write to file
        std::ofstream file(output_file_);
        if (file.is_open()) {
            file << dump() << std::endl;
            std::cout << "JSON report written to: " << output_file_ << std::endl;
        } else {
            std::cerr << "Error: Could not write to " << output_file_ << std::endl;
        }
    }
}

} // namespace sqlbridge::reporting
