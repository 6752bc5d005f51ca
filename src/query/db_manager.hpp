#pragma once

#include "config/database_config.hpp"
#include "core/session.hpp"
#include "dialect/dialect.hpp"
#include "query_result.hpp"
#include "result_normalizer.hpp"
#include "table_templater.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sqlbridge::query {

/**
 * @brief Owns one database session and executes templated, parameterized SQL
 *
 * Construction validates the configuration, selects the dialect and connects;
 * all of that throws core::DbError. After construction no operation throws:
 * statement failures come back as QueryResult errors and are logged.
 *
 * Every public operation holds an internal mutex, so one manager may be
 * shared between threads; statements still run one at a time.
 *
 * Example:
 *   DbManager db(config);
 *   auto result = db.execute("SELECT * FROM {node_field_data} WHERE nid = ?", {42}, true);
 *   if (const core::Row* row = result.first()) { ... }
 */
class DbManager {
public:
    // Uses an OdbcSession
    explicit DbManager(config::DatabaseConfig config);

    // Uses the given session (tests, alternative drivers)
    DbManager(config::DatabaseConfig config, std::unique_ptr<core::Session> session);

    ~DbManager();

    DbManager(const DbManager&) = delete;
    DbManager& operator=(const DbManager&) = delete;

    // Releases the session; the next execute() reconnects
    void close();

    bool is_connected() const;

    /**
     * @brief Expand placeholders, bind params to '?' markers and run the statement
     *
     * Reconnects once when no live session exists. With fetch_one only the
     * first row is fetched. Statements without a result set are committed.
     */
    QueryResult execute(std::string_view query,
                        const std::vector<core::Value>& params = {},
                        bool fetch_one = false);

    QueryResult execute(const dialect::BoundQuery& query, bool fetch_one = false);

    // {table} -> prefix + table
    std::string prepare_query(std::string_view query) const;

    std::string physical_table_name(std::string_view logical) const;

    const config::DatabaseConfig& config() const noexcept { return config_; }
    const dialect::Dialect& dialect() const noexcept { return *dialect_; }

private:
    // Both expect mutex_ to be held
    void connect();
    bool ensure_connected(std::string& failure);

    const config::DatabaseConfig config_;
    std::unique_ptr<dialect::Dialect> dialect_;
    std::unique_ptr<core::Session> session_;
    TableTemplater templater_;
    ResultNormalizer normalizer_;
    mutable std::mutex mutex_;
};

// Query text cut to max_length characters with "..." appended, for logs
std::string truncate_for_log(std::string_view text, std::size_t max_length = 200);

// "[1, 'abc', NULL]"
std::string format_params(const std::vector<core::Value>& params);

} // namespace sqlbridge::query
