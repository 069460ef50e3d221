// =============================================================================
// refdb - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Scoped log sessions that tee every message into timestamped
//   <scope>_<version>_<timestamp>.out / .err files and restore the previous
//   logger when they go out of scope
//
// Usage:
//   refdb::log::init("", refdb::log::Level::kInfo);
//   {
//       refdb::log::LogSession session("logs", "job", "v2", timestamp);
//       REFDB_LOG_INFO("Message with {} args", 42);
//   }  // back to console-only logging here
// =============================================================================

#ifndef REFDB_COMMON_LOGGER_H
#define REFDB_COMMON_LOGGER_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace refdb::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "refdb";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Called once at application startup; later calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the active logger instance.
/// @return The innermost open LogSession's logger, or the global logger.
/// @note Returns nullptr if init() has not been called.
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
/// @note Blocks until all messages are written.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert refdb::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

// =============================================================================
// Scoped Log Session
// =============================================================================

/// @brief Format a wall-clock time as YYYYmmdd_HHMMSS (local time).
[[nodiscard]] std::string formatTimestamp(std::chrono::system_clock::time_point time);

/// @brief Duplicates all log output into a pair of per-scope log files.
///
/// While a session is alive every message reaches the enclosing sinks
/// (console and any outer session) as well as
/// `<logDir>/<scope>_<version>_<timestamp>.out` (all levels) and
/// `<logDir>/<scope>_<version>_<timestamp>.err` (warnings and above).
/// The destructor flushes and reinstates the enclosing logger, so the
/// previous output routing is restored on normal return, on exceptions and
/// during unwinding after cancellation.
class LogSession {
public:
    /// @brief Open a session.
    /// @throws IOError if the log directory cannot be created.
    LogSession(const std::filesystem::path& logDir, std::string_view scope,
               std::string_view version, std::string_view timestamp);

    ~LogSession();

    LogSession(const LogSession&) = delete;
    LogSession& operator=(const LogSession&) = delete;
    LogSession(LogSession&&) = delete;
    LogSession& operator=(LogSession&&) = delete;

    /// @brief Path of the file receiving every message.
    [[nodiscard]] const std::filesystem::path& outPath() const noexcept { return outPath_; }

    /// @brief Path of the file receiving warnings and errors.
    [[nodiscard]] const std::filesystem::path& errPath() const noexcept { return errPath_; }

private:
    std::filesystem::path outPath_;
    std::filesystem::path errPath_;
    quill::Logger* logger_ = nullptr;
    quill::Logger* previousLogger_ = nullptr;
    std::vector<std::shared_ptr<quill::Sink>> previousSinks_;
};

}  // namespace refdb::log

// =============================================================================
// Convenience Macros
// =============================================================================

/// @brief Log a trace message.
#define REFDB_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(refdb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define REFDB_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(refdb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define REFDB_LOG_INFO(fmt, ...) \
    LOG_INFO(refdb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define REFDB_LOG_WARNING(fmt, ...) \
    LOG_WARNING(refdb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define REFDB_LOG_ERROR(fmt, ...) \
    LOG_ERROR(refdb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define REFDB_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(refdb::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // REFDB_COMMON_LOGGER_H
