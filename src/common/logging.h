#pragma once

/// @file logging.h
/// @brief rulemux logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace rulemux {

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
    std::string name = "rulemux";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "rulemux.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the global logger with the given configuration
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
/// @return Shared pointer to the logger
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
/// @param level Log level to set
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error")
/// @return The matching level, kInfo for anything unrecognised
LogLevel ParseLogLevel(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define RULEMUX_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::rulemux::GetLogger(), __VA_ARGS__)
#define RULEMUX_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::rulemux::GetLogger(), __VA_ARGS__)
#define RULEMUX_LOG_INFO(...) SPDLOG_LOGGER_INFO(::rulemux::GetLogger(), __VA_ARGS__)
#define RULEMUX_LOG_WARN(...) SPDLOG_LOGGER_WARN(::rulemux::GetLogger(), __VA_ARGS__)
#define RULEMUX_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::rulemux::GetLogger(), __VA_ARGS__)
#define RULEMUX_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::rulemux::GetLogger(), __VA_ARGS__)

}  // namespace rulemux
