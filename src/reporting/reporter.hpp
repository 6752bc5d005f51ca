#pragma once

#include "query/query_result.hpp"
#include "schema/schema_introspector.hpp"
#include "search/table_search.hpp"
#include <string>
#include <vector>

namespace sqlbridge::reporting {

// Reporter interface
class Reporter {
public:
    virtual ~Reporter() = default;

    // Report the start of a command against a database
    virtual void report_start(const std::string& command, const std::string& target) = 0;

    virtual void report_tables(const std::vector<std::string>& tables) = 0;

    virtual void report_schema(const schema::TableSchema& schema) = 0;

    // Rows, rows-affected count or error of one statement
    virtual void report_result(const query::QueryResult& result) = 0;

    virtual void report_findings(const std::string& needle,
                                 const std::vector<search::SearchFinding>& findings) = 0;

    virtual void report_error(const std::string& message) = 0;

    // Report the end of the command
    virtual void report_end() = 0;
};

} // namespace sqlbridge::reporting
