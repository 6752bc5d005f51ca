#pragma once

#include "reporter.hpp"
#include <iostream>

namespace sqlbridge::reporting {

// Console reporter with formatted output
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, bool verbose = false)
        : out_(out), verbose_(verbose) {}

    void report_start(const std::string& command, const std::string& target) override;
    void report_tables(const std::vector<std::string>& tables) override;
    void report_schema(const schema::TableSchema& schema) override;
    void report_result(const query::QueryResult& result) override;
    void report_findings(const std::string& needle,
                         const std::vector<search::SearchFinding>& findings) override;
    void report_error(const std::string& message) override;
    void report_end() override;

private:
    std::ostream& out_;
    bool verbose_;

    void print_rows(const std::vector<core::Row>& rows, const std::string& indent);
};

} // namespace sqlbridge::reporting
