#include "odbc_session.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace sqlbridge::core {

OdbcSession::~OdbcSession() {
    close();
}

void OdbcSession::open(const std::string& connection_string, int login_timeout_seconds) {
    close();

    auto env = std::make_unique<OdbcEnvironment>();
    auto conn = std::make_unique<OdbcConnection>(*env);
    try {
        conn->connect(connection_string, login_timeout_seconds);
    } catch (const OdbcError& e) {
        // IM002: the driver named in the connection string is not registered
        if (e.sqlstate() != "IM002") {
            throw;
        }
        std::string installed;
        for (const auto& name : env->installed_drivers()) {
            installed += (installed.empty() ? "" : ", ") + name;
        }
        throw OdbcError(std::string(e.what()) + " (installed ODBC drivers: " +
                        (installed.empty() ? "none" : installed) + ")",
                        e.diagnostics());
    }
    auto stmt = std::make_unique<OdbcStatement>(*conn);

    LOG_INFO("Connected to " + conn->dbms_name() + " " + conn->dbms_version());

    env_ = std::move(env);
    conn_ = std::move(conn);
    stmt_ = std::move(stmt);
}

void OdbcSession::close() noexcept {
    bool was_open = conn_ != nullptr;

    stmt_.reset();
    if (conn_) {
        try {
            conn_->disconnect();
        } catch (const OdbcError& e) {
            LOG_WARN(std::string("SQLDisconnect failed, releasing handle anyway: ") + e.what());
        }
    }
    conn_.reset();
    env_.reset();

    if (was_open) {
        LOG_INFO("Database connection closed");
    }
}

bool OdbcSession::is_open() const {
    return conn_ && stmt_ && conn_->is_alive();
}

RawResult OdbcSession::execute(std::string_view sql, const std::vector<Value>& params, FetchMode mode) {
    if (!stmt_) {
        throw OdbcError("Session is not open");
    }

    LOG_TRACE("Executing: " + std::string(sql));
    stmt_->execute(sql, params);

    RawResult result;
    result.columns = stmt_->describe_columns();
    result.has_result_set = !result.columns.empty();

    if (!result.has_result_set) {
        result.affected_rows = stmt_->row_count();
        return result;
    }

    while (stmt_->fetch()) {
        RawRow row;
        row.reserve(result.columns.size());
        for (std::size_t i = 0; i < result.columns.size(); ++i) {
            row.push_back(stmt_->get_cell(static_cast<SQLUSMALLINT>(i + 1),
                                          is_binary_sql_type(result.columns[i].sql_type)));
        }
        result.rows.push_back(std::move(row));

        if (mode == FetchMode::ONE) {
            break;
        }
    }
    stmt_->close_cursor();

    return result;
}

void OdbcSession::commit() {
    if (!conn_) {
        throw OdbcError("Session is not open");
    }
    conn_->commit();
}

} // namespace sqlbridge::core
