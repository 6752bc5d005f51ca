#pragma once

#include "session.hpp"
#include "odbc_environment.hpp"
#include "odbc_connection.hpp"
#include "odbc_statement.hpp"
#include <memory>

namespace sqlbridge::core {

// Session backed by the ODBC driver manager
class OdbcSession : public Session {
public:
    OdbcSession() = default;
    ~OdbcSession() override;

    OdbcSession(const OdbcSession&) = delete;
    OdbcSession& operator=(const OdbcSession&) = delete;

    void open(const std::string& connection_string, int login_timeout_seconds) override;
    void close() noexcept override;
    bool is_open() const override;

    RawResult execute(std::string_view sql, const std::vector<Value>& params, FetchMode mode) override;

    void commit() override;

private:
    // Declaration order is destruction order in reverse: statement first
    std::unique_ptr<OdbcEnvironment> env_;
    std::unique_ptr<OdbcConnection> conn_;
    std::unique_ptr<OdbcStatement> stmt_;
};

} // namespace sqlbridge::core
