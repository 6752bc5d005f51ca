#include "db_manager.hpp"
#include "placeholder_rewriter.hpp"
#include "core/db_error.hpp"
#include "core/logger.hpp"
#include "core/odbc_error.hpp"
#include "core/odbc_session.hpp"
#include <sstream>

namespace sqlbridge::query {

namespace {

config::DatabaseConfig validated(config::DatabaseConfig config) {
    try {
        config.validate();
    } catch (const core::DbError& e) {
        LOG_ERROR(e.what());
        throw;
    }
    return config;
}

} // anonymous namespace

std::string truncate_for_log(std::string_view text, std::size_t max_length) {
    if (text.size() <= max_length) {
        return std::string(text);
    }
    return std::string(text.substr(0, max_length)) + "...";
}

std::string format_params(const std::vector<core::Value>& params) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        if (params[i].is_text()) {
            oss << "'" << params[i].as_text() << "'";
        } else {
            oss << params[i].to_string();
        }
    }
    oss << "]";
    return oss.str();
}

DbManager::DbManager(config::DatabaseConfig config)
    : DbManager(std::move(config), std::make_unique<core::OdbcSession>()) {
}

DbManager::DbManager(config::DatabaseConfig config, std::unique_ptr<core::Session> session)
    : config_(validated(std::move(config))),
      dialect_(dialect::make_dialect(config_.driver)),
      session_(std::move(session)),
      templater_(config_.prefix, dialect_->lexical_rules()),
      normalizer_(*dialect_) {
    if (!session_) {
        throw core::DbError(core::ErrorKind::CONNECTION_FAILURE, "No session supplied");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connect();
}

DbManager::~DbManager() {
    if (session_) {
        session_->close();
    }
}

void DbManager::connect() {
    const std::string where = config_.database + " at " + config_.host + ":" + std::to_string(config_.port);

    try {
        session_->open(dialect_->connection_string(config_), config_.login_timeout);
    } catch (const core::OdbcError& e) {
        std::string message = std::string(dialect_->display_name()) + " Error: " + e.what();
        LOG_ERROR(message);
        throw core::DbError(core::ErrorKind::CONNECTION_FAILURE, message, e.diagnostics());
    }

    LOG_INFO(std::string("Successfully connected to ") + dialect_->display_name() +
             " database: " + where);
}

bool DbManager::ensure_connected(std::string& failure) {
    if (session_->is_open()) {
        return true;
    }

    LOG_WARN("No active database connection. Attempting to reconnect...");
    session_->close();
    try {
        connect();
    } catch (const core::DbError& e) {
        failure = std::string("Reconnection failed: ") + e.what();
        LOG_ERROR(failure);
        return false;
    }
    return true;
}

void DbManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_->close();
}

bool DbManager::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_->is_open();
}

QueryResult DbManager::execute(std::string_view query,
                               const std::vector<core::Value>& params,
                               bool fetch_one) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string failure;
    if (!ensure_connected(failure)) {
        return QueryResult::error(core::ErrorKind::CONNECTION_FAILURE, failure);
    }

    const RewrittenQuery rewritten =
        rewrite_placeholders(templater_.prepare(query), dialect_->lexical_rules());

    if (rewritten.marker_count != params.size()) {
        std::string message = "Statement has " + std::to_string(rewritten.marker_count) +
                              " parameter markers but " + std::to_string(params.size()) +
                              " parameters were supplied";
        LOG_ERROR(message + " for query: " + truncate_for_log(rewritten.sql));
        return QueryResult::error(core::ErrorKind::QUERY_FAILURE, message);
    }

    try {
        core::RawResult raw = session_->execute(rewritten.sql, params,
                                                fetch_one ? core::FetchMode::ONE : core::FetchMode::ALL);

        if (!raw.has_result_set) {
            session_->commit();
            return QueryResult::no_result_set(raw.affected_rows);
        }

        return QueryResult::with_rows(normalizer_.normalize(raw));

    } catch (const core::OdbcError& e) {
        LOG_ERROR(std::string(dialect_->display_name()) + " Query Error: " + e.what() +
                  " for query: " + truncate_for_log(rewritten.sql) +
                  " with params: " + format_params(params));

        if (e.is_connection_error()) {
            LOG_WARN("Connection lost, the next statement will reconnect");
            session_->close();
        }

        return QueryResult::error(core::ErrorKind::QUERY_FAILURE, e.what(), e.diagnostics());
    }
}

QueryResult DbManager::execute(const dialect::BoundQuery& query, bool fetch_one) {
    return execute(query.sql, query.params, fetch_one);
}

std::string DbManager::prepare_query(std::string_view query) const {
    return templater_.prepare(query);
}

std::string DbManager::physical_table_name(std::string_view logical) const {
    return templater_.physical_name(logical);
}

} // namespace sqlbridge::query
