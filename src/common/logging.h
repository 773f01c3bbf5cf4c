#pragma once

/// @file logging.h
/// @brief Inventory Sense logging utilities wrapping spdlog

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace invsense {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "invsense";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // Console output goes to stderr so that JSON reports on stdout stay clean
    bool console_to_stderr = true;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "invsense.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 3;
};

/// @brief Initialize the global logger with the given configuration
/// @note Calls after the first are ignored until ShutdownLogging()
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance, initializing defaults on first use
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off")
std::optional<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define INVSENSE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::invsense::GetLogger(), __VA_ARGS__)
#define INVSENSE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::invsense::GetLogger(), __VA_ARGS__)
#define INVSENSE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::invsense::GetLogger(), __VA_ARGS__)
#define INVSENSE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::invsense::GetLogger(), __VA_ARGS__)
#define INVSENSE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::invsense::GetLogger(), __VA_ARGS__)
#define INVSENSE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::invsense::GetLogger(), __VA_ARGS__)

}  // namespace invsense
