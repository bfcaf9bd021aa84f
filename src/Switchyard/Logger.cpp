// =================================================================
// src/Switchyard/Logger.cpp
// =================================================================
// Implementation for the process-wide logging system.

#include "Switchyard/Logger.hpp"
#include "Switchyard/UsageMeter.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace Switchyard {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    initializeLocked(config);
    info("Logger", "Logging system initialized", m_config.file_enabled ? m_config.log_dir : "console only");
}

void Logger::initializeLocked(const LoggerConfig& config) {
    m_config = config;
    m_current_log_size = 0;
    m_current_log_file.reset();
    m_initialized = true;

    if (m_config.file_enabled) {
        ensureLogDirectory();
        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
        if (!m_current_log_file->is_open()) {
            std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
            m_current_log_file.reset();
        }
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_config.console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_config.file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_config.console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logRoutingDecision(const std::string& request_id, const RoutingDecision& decision, bool success) {
    std::ostringstream context;
    context << "Request: " << request_id << ", ";
    context << "Attempts: " << decision.attempts.size() << ", ";
    context << "Rationale: " << decision.rationale;

    if (success) {
        info("Dispatcher", "Request served by " + decision.backend_id, context.str());
    } else {
        error("Dispatcher", "Request could not be served", context.str());
    }

    // Per-attempt detail
    for (const auto& attempt : decision.attempts) {
        std::ostringstream attempt_context;
        attempt_context << "Outcome: " << RoutingTypeUtils::attemptOutcomeToString(attempt.outcome) << ", ";
        attempt_context << "Latency: " << attempt.latency.count() << "ms";
        if (!attempt.detail.empty()) {
            attempt_context << ", Detail: " << attempt.detail;
        }
        debug("Dispatcher", request_id + " -> " + attempt.backend_id, attempt_context.str());
    }
}

void Logger::logBreakerTransition(const std::string& backend_id, BreakerState from,
                                  BreakerState to, const std::string& reason) {
    std::string message = "Breaker " + backend_id + ": " +
        RoutingTypeUtils::breakerStateToString(from) + " -> " +
        RoutingTypeUtils::breakerStateToString(to);

    if (to == BreakerState::OPEN) {
        warning("CircuitBreaker", message, reason);
    } else {
        info("CircuitBreaker", message, reason);
    }
}

void Logger::logUsageRecord(const UsageRecord& record) {
    std::ostringstream context;
    context << "Tier: " << RoutingTypeUtils::tierToString(record.tier) << ", ";
    context << "Backend: " << (record.backend_id.empty() ? "-" : record.backend_id) << ", ";
    context << "Latency: " << record.latency.count() << "ms, ";
    context << std::fixed << std::setprecision(4);
    context << "Cost: " << record.cost << ", ";
    context << "Margin: " << record.margin;

    debug("UsageMeter", "Recorded " + record.request_id + (record.success ? " (success)" : " (failed)"),
          context.str());
}

void Logger::logSessionStart(const std::string& command, const std::string& detail) {
    std::ostringstream context;
    context << "Command: " << command;
    if (!detail.empty()) {
        context << ", " << detail;
    }

    info("Session", "Session started", context.str());
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "crit" || lowered == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (!m_initialized) {
        // Initialize with defaults if not done yet
        initializeLocked(LoggerConfig());
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_config.console_enabled || entry.level < m_config.console_level) {
        return;
    }

    // Console output goes to stderr so stdout stays parseable JSON
    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_config.file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << '\n';
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": " << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_config.max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        std::cerr << "[WARN] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
    }

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_config.log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                  [](const std::filesystem::path& a, const std::filesystem::path& b) {
                      return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                  });

        for (size_t i = m_config.max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_config.log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        // Fall back to current directory
        m_config.log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream filename;
    filename << m_config.log_dir << "/switchyard_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    filename << "_" << m_file_sequence++;
    filename << ".log";

    return filename.str();
}

} // namespace Switchyard
