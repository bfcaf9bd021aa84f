// =================================================================
// include/Switchyard/Logger.hpp
// =================================================================
// Header for process-wide logging and audit trails.

#pragma once

#include "Switchyard/RoutingTypes.hpp"
#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Switchyard {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Logging configuration, usually read from the "logging" section
 */
struct LoggerConfig {
    std::string log_dir = ".switchyard/logs";      ///< Directory for log files
    size_t max_log_size = 10 * 1024 * 1024;        ///< Maximum size per log file (bytes)
    size_t max_log_files = 5;                      ///< Maximum number of log files to keep
    LogLevel console_level = LogLevel::INFO;       ///< Minimum level shown on console
    LogLevel file_level = LogLevel::DEBUG;         ///< Minimum level written to files
    bool console_enabled = true;                   ///< Console output on/off
    bool file_enabled = true;                      ///< File output on/off
};

struct UsageRecord;

/**
 * @brief Process-wide logger shared by request threads and the health monitor
 *
 * Provides structured logging with console and rotating file outputs and
 * specialized helpers for routing, circuit breaker and metering events.
 * All public methods may be called concurrently.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param config Output targets, levels and rotation limits
     */
    void initialize(const LoggerConfig& config = LoggerConfig());

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a routing walk
     * @param request_id Request identifier
     * @param decision Decision produced by the dispatcher
     * @param success Whether a backend served the request
     */
    void logRoutingDecision(const std::string& request_id, const RoutingDecision& decision, bool success);

    /**
     * @brief Log a circuit breaker state change
     * @param backend_id Backend whose breaker changed
     * @param from Previous state
     * @param to New state
     * @param reason What triggered the transition
     */
    void logBreakerTransition(const std::string& backend_id, BreakerState from,
                              BreakerState to, const std::string& reason);

    /**
     * @brief Log a metering record
     * @param record The usage record that was written
     */
    void logUsageRecord(const UsageRecord& record);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param detail Free-form detail (config path, prompt size, ...)
     */
    void logSessionStart(const std::string& command, const std::string& detail);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "info", "warn", ...)
     * @return Parsed level, INFO for unknown names
     */
    static LogLevel parseLevel(const std::string& name);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig m_config;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    size_t m_file_sequence = 0;

    std::recursive_mutex m_mutex;

    void initializeLocked(const LoggerConfig& config);
    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Switchyard::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Switchyard::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Switchyard::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Switchyard::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Switchyard::Logger::getInstance().critical(component, message)

} // namespace Switchyard
