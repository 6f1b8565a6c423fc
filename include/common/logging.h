#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>

namespace pinion {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Debug logging should be disabled in release configurations; the
 * execution engine logs every instruction at DEBUG.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * @brief Parse a level name ("TRACE" .. "CRITICAL", case-sensitive)
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Structured log entry for JSON logging
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Process-wide logger
 *
 * Level and format can be adjusted at runtime. Performance-critical paths
 * should check is_enabled() before formatting strings (the macros below do).
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Set current logging level
    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            oss.str(),
            "",
            {}
        };

        output_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code = "",
                        const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            message,
            error_code,
            context
        };

        output_log_entry(entry);
    }

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)), json_format_(false) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::mutex output_mutex_;

    void output_log_entry(const LogEntry& entry) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        if (json_format_.load()) {
            std::cout << format_json(entry) << std::endl;
        } else {
            std::cout << format_text(entry) << std::endl;
        }
    }

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;
    std::string escape_json_string(const std::string& input) const;
};

/// @brief Level name as printed in log lines
std::string level_to_string(LogLevel level);

} // namespace common
} // namespace pinion

/**
 * @brief Performance-conscious logging macros
 *
 * The first argument is the module name, the rest are streamed into the
 * message. Formatting is skipped entirely when the level is disabled.
 */
#define LOG_TRACE(...) \
    do { \
        if (pinion::common::Logger::instance().is_enabled(pinion::common::LogLevel::TRACE)) { \
            pinion::common::Logger::instance().log(pinion::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (pinion::common::Logger::instance().is_debug_enabled()) { \
            pinion::common::Logger::instance().log(pinion::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    pinion::common::Logger::instance().log(pinion::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    pinion::common::Logger::instance().log(pinion::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    pinion::common::Logger::instance().log(pinion::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_CRITICAL(...) \
    pinion::common::Logger::instance().log(pinion::common::LogLevel::CRITICAL, __VA_ARGS__)

/**
 * @brief Structured logging macros for better observability
 */
#define LOG_STRUCTURED(level, module, message, ...) \
    pinion::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

/**
 * @brief Module-specific failure macros
 */
#define LOG_SVM_ERROR(message, ...) \
    LOG_STRUCTURED(pinion::common::LogLevel::ERROR, "svm", message, ##__VA_ARGS__)

#define LOG_PROGRAM_ERROR(program, message, ...) \
    LOG_STRUCTURED(pinion::common::LogLevel::WARN, program, message, ##__VA_ARGS__)

#define LOG_CONFIG_ERROR(message, ...) \
    LOG_STRUCTURED(pinion::common::LogLevel::ERROR, "config", message, ##__VA_ARGS__)
