// =============================================================================
// refdb - Logger Module Implementation
// =============================================================================
// Implementation of the asynchronous logging module and scoped log sessions
// using Quill.
// =============================================================================

#include "refdb/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

#include "refdb/common/error.h"

namespace refdb::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

/// @brief Active logger instance pointer (innermost session or the base logger).
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Flag indicating if the logger has been initialized.
std::atomic<bool> gInitialized{false};

/// @brief Mutex guarding initialization and session switching.
std::mutex gInitMutex;

/// @brief Sinks attached to the active logger; sessions extend this set.
std::vector<std::shared_ptr<quill::Sink>> gActiveSinks;

/// @brief Counter for unique session logger names.
std::atomic<unsigned> gSessionCounter{0};

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::shared_ptr<quill::Sink> createFileSink(const std::filesystem::path& path) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(
        path.string(),
        []() {
            quill::FileSinkConfig fileSinkConfig;
            fileSinkConfig.set_open_mode('a');
            return fileSinkConfig;
        }(),
        quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
        default:
            return quill::LogLevel::Info;
    }
}

Level levelFromString(std::string_view levelStr) noexcept {
    const std::string lower = toLower(levelStr);

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "info") {
        return Level::kInfo;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical" || lower == "fatal") {
        return Level::kCritical;
    }

    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
        default:
            return "info";
    }
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    // Prevent double initialization
    if (gInitialized.load(std::memory_order_acquire)) {
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    // -v/-q select what reaches the terminal; file sinks keep info and above
    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
        sinks.back()->set_log_level_filter(toQuillLevel(config.level));
    }

    if (!config.logFile.empty()) {
        sinks.push_back(createFileSink(config.logFile));
    }

    // A logger needs at least one sink
    if (sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
        sinks.back()->set_log_level_filter(quill::LogLevel::Error);
    }

    gActiveSinks = sinks;
    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(std::min(config.level, Level::kInfo)));

    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    config.enableConsole = true;
    config.loggerName = "refdb";

    init(config);
}

// =============================================================================
// Logger Access Implementation
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (isInitialized()) {
        quill::Logger* loggerPtr = logger();
        if (loggerPtr != nullptr) {
            loggerPtr->flush_log();
        }
    }
}

void shutdown() {
    if (isInitialized()) {
        flush();

        quill::Backend::stop();

        std::lock_guard<std::mutex> lock(gInitMutex);
        gActiveSinks.clear();
        gLogger.store(nullptr, std::memory_order_release);
        gInitialized.store(false, std::memory_order_release);
    }
}

// =============================================================================
// LogSession Implementation
// =============================================================================

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    const std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&raw, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return oss.str();
}

LogSession::LogSession(const std::filesystem::path& logDir, std::string_view scope,
                       std::string_view version, std::string_view timestamp) {
    // The backend thread must be running before flush_log() can return
    if (!isInitialized()) {
        init();
    }

    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    if (ec) {
        throw IOError("Cannot create log directory", ec, ErrorContext(logDir.string()));
    }

    const std::string stem =
        std::string(scope) + "_" + std::string(version) + "_" + std::string(timestamp);
    outPath_ = logDir / (stem + ".out");
    errPath_ = logDir / (stem + ".err");

    std::lock_guard<std::mutex> lock(gInitMutex);

    previousLogger_ = gLogger.load(std::memory_order_acquire);
    previousSinks_ = gActiveSinks;

    auto outSink = createFileSink(outPath_);
    auto errSink = createFileSink(errPath_);
    errSink->set_log_level_filter(quill::LogLevel::Warning);

    std::vector<std::shared_ptr<quill::Sink>> sinks = previousSinks_;
    sinks.push_back(std::move(outSink));
    sinks.push_back(std::move(errSink));
    gActiveSinks = sinks;

    const std::string loggerName = "refdb_" + stem + "_" + std::to_string(gSessionCounter++);
    logger_ = quill::Frontend::create_or_get_logger(loggerName, std::move(sinks));
    // Session files record info and above even when the terminal is quiet
    quill::LogLevel level = quill::LogLevel::Info;
    if (previousLogger_ != nullptr && previousLogger_->get_log_level() < level) {
        level = previousLogger_->get_log_level();
    }
    logger_->set_log_level(level);

    gLogger.store(logger_, std::memory_order_release);
}

LogSession::~LogSession() {
    logger_->flush_log();

    std::lock_guard<std::mutex> lock(gInitMutex);
    gActiveSinks = std::move(previousSinks_);
    gLogger.store(previousLogger_, std::memory_order_release);
    quill::Frontend::remove_logger(logger_);
}

}  // namespace refdb::log
