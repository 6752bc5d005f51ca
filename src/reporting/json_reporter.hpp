#pragma once

#include "reporter.hpp"
#include "core/value.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace sqlbridge::core {

// nlohmann/json conversions, found by ADL
void to_json(nlohmann::json& j, const Value& value);
void to_json(nlohmann::json& j, const Row& row);
void to_json(nlohmann::json& j, const OdbcDiagnostic& diag);

} // namespace sqlbridge::core

namespace sqlbridge::reporting {

// JSON reporter for structured output
class JsonReporter : public Reporter {
public:
    explicit JsonReporter(const std::string& output_file = "")
        : output_file_(output_file) {}

    void report_start(const std::string& command, const std::string& target) override;
    void report_tables(const std::vector<std::string>& tables) override;
    void report_schema(const schema::TableSchema& schema) override;
    void report_result(const query::QueryResult& result) override;
    void report_findings(const std::string& needle,
                         const std::vector<search::SearchFinding>& findings) override;
    void report_error(const std::string& message) override;
    void report_end() override;

    // The document written by report_end()
    const nlohmann::json& document() const noexcept { return root_; }

    // Indented text of document(); invalid UTF-8 in text cells becomes U+FFFD
    std::string dump() const;

private:
    std::string output_file_;
    nlohmann::json root_;
};

} // namespace sqlbridge::reporting
