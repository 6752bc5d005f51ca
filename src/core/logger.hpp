#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <fstream>
#include <chrono>
#include <mutex>
#include <optional>

namespace sqlbridge::core {

/**
 * @brief Log levels for diagnostics
 */
enum class LogLevel {
    TRACE,   // Every statement sent to the driver
    DEBUG,   // Branch decisions, dialect choices
    INFO,    // Connections opened and closed
    WARN,    // Recoverable failures (reconnects, skipped columns)
    ERROR,   // Failed queries and connections
    FATAL    // Unusable configuration
};

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal").
 * Case-insensitive; "warning" is accepted for WARN.
 */
std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Thread-safe singleton logger
 *
 * Every failed statement in the access layer is reported here, since the
 * executor turns driver errors into result values instead of exceptions.
 *
 * Usage:
 *   Logger::instance().set_level(LogLevel::DEBUG);
 *   Logger::instance().set_output("sqlbridge.log");
 *
 *   LOG_INFO("Connected to " + dsn);
 *   LOG_IF(reconnected, "Session reopened", "Session still closed");
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    /**
     * @brief Append to a log file (empty closes the file and logs to console only)
     */
    void set_output(std::string_view filename);

    void set_console_enabled(bool enabled);

    bool enabled(LogLevel level) const;

    void log(LogLevel level, std::string_view file, int line,
             std::string_view function, std::string_view message);

    /**
     * @brief Log which way a branch went, at DEBUG
     */
    void log_branch(bool condition, std::string_view file, int line,
                   std::string_view function,
                   std::string_view true_msg,
                   std::string_view false_msg = "");

private:
    Logger();
    ~Logger();

    LogLevel min_level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::ofstream file_stream_;
    mutable std::mutex mutex_;

    static const char* level_to_string(LogLevel level);
    static std::string timestamp();
    static std::string_view basename(std::string_view path);
};

} // namespace sqlbridge::core

#define LOG_TRACE(msg) \
    sqlbridge::core::Logger::instance().log( \
        sqlbridge::core::LogLevel::TRACE, __FILE__, __LINE__, __func__, msg)

#define LOG_DEBUG(msg) \
    sqlbridge::core::Logger::instance().log( \
        sqlbridge::core::LogLevel::DEBUG, __FILE__, __LINE__, __func__, msg)

#define LOG_INFO(msg) \
    sqlbridge::core::Logger::instance().log( \
        sqlbridge::core::LogLevel::INFO, __FILE__, __LINE__, __func__, msg)

#define LOG_WARN(msg) \
    sqlbridge::core::Logger::instance().log( \
        sqlbridge::core::LogLevel::WARN, __FILE__, __LINE__, __func__, msg)

#define LOG_ERROR(msg) \
    sqlbridge::core::Logger::instance().log( \
        sqlbridge::core::LogLevel::ERROR, __FILE__, __LINE__, __func__, msg)

#define LOG_FATAL(msg) \
    sqlbridge::core::Logger::instance().log( \
        sqlbridge::core::LogLevel::FATAL, __FILE__, __LINE__, __func__, msg)

#define LOG_IF(condition, true_msg, ...) \
    sqlbridge::core::Logger::instance().log_branch( \
        (condition), __FILE__, __LINE__, __func__, \
        true_msg, ##__VA_ARGS__)
