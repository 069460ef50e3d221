// =============================================================================
// refdb - Error Handling Framework
// =============================================================================
// Error handling for the refdb library and command-line tool.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - RefdbException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Configuration error (bad arguments, missing or empty manifest)
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (corrupt archive, malformed input)
// - 4: Stage failure (a pipeline stage could not proceed)
// - 5: Cancelled by signal
// =============================================================================

#ifndef REFDB_COMMON_ERROR_H
#define REFDB_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace refdb {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Configuration or argument error.
    /// @note Missing version tag, unknown flag, missing or empty manifest.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Format error.
    /// @note Corrupt zip archive, truncated gzip stream, etc.
    kFormatError = 3,

    /// @brief A pipeline stage could not proceed.
    kStageFailure = 4,

    /// @brief Operation was cancelled (SIGINT/SIGTERM).
    kCancelled = 5
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "configuration error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kStageFailure:
            return "stage failure";
        case ErrorCode::kCancelled:
            return "cancelled";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Genome accession being processed (if applicable).
    std::optional<std::string> accession;

    /// @brief Byte offset in file where error occurred (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withAccession(std::string id) {
        accession = std::move(id);
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all refdb errors.
/// @note Provides error code, message, and optional context.
class RefdbException : public std::exception {
public:
    RefdbException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    RefdbException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~RefdbException() override = default;

    RefdbException(const RefdbException&) = default;
    RefdbException(RefdbException&&) noexcept = default;
    RefdbException& operator=(const RefdbException&) = default;
    RefdbException& operator=(RefdbException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for configuration errors (exit code 1).
/// @note Thrown for a missing version tag, unknown arguments and unusable
///       input files. No pipeline work has been performed when it is raised.
class ConfigurationError : public RefdbException {
public:
    explicit ConfigurationError(std::string message)
        : RefdbException(ErrorCode::kUsageError, std::move(message)) {}

    ConfigurationError(std::string message, ErrorContext context)
        : RefdbException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for an absent or empty accession manifest (exit code 1).
class ManifestError : public ConfigurationError {
public:
    explicit ManifestError(std::string message) : ConfigurationError(std::move(message)) {}

    ManifestError(std::string message, ErrorContext context)
        : ConfigurationError(std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
class IOError : public RefdbException {
public:
    explicit IOError(std::string message)
        : RefdbException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : RefdbException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : RefdbException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : RefdbException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                         std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for malformed archives and compressed streams (exit code 3).
class ArchiveError : public RefdbException {
public:
    explicit ArchiveError(std::string message)
        : RefdbException(ErrorCode::kFormatError, std::move(message)) {}

    ArchiveError(std::string message, ErrorContext context)
        : RefdbException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception raised when a whole pipeline stage cannot proceed (exit code 4).
class StageFailure : public RefdbException {
public:
    StageFailure(std::string stage, std::string message)
        : RefdbException(ErrorCode::kStageFailure, formatStageMessage(stage, message)),
          stage_(std::move(stage)) {}

    /// @brief Name of the failing stage.
    [[nodiscard]] const std::string& stage() const noexcept { return stage_; }

private:
    static std::string formatStageMessage(const std::string& stage, const std::string& message);

    std::string stage_;
};

/// @brief Exception raised when the run is interrupted (exit code 5).
class CancelledError : public RefdbException {
public:
    explicit CancelledError(std::string message)
        : RefdbException(ErrorCode::kCancelled, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a RefdbException.
    explicit Error(const RefdbException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

/// @brief Create an error void result.
[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Convert a Result to an exception if it contains an error (void version).
inline void unwrapOrThrow(const VoidResult& result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Try to execute a function and convert exceptions to Result.
/// @tparam F The function type.
/// @param func The function to execute.
/// @return Result containing the return value or error.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) {
    using ReturnType = decltype(func());
    using ValueType = std::conditional_t<std::is_void_v<ReturnType>, std::monostate, ReturnType>;
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return Result<ValueType>{std::monostate{}};
        } else {
            return Result<ValueType>{func()};
        }
    } catch (const RefdbException& ex) {
        return Result<ValueType>{std::unexpected(Error{ex})};
    } catch (const std::exception& ex) {
        return Result<ValueType>{std::unexpected(Error{ErrorCode::kIOError, ex.what()})};
    }
}

}  // namespace refdb

#endif  // REFDB_COMMON_ERROR_H
