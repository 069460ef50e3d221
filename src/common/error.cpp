// =============================================================================
// refdb - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "refdb/common/error.h"

#include <format>
#include <sstream>

namespace refdb {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (accession.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "accession: " << *accession;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: 0x" << std::hex << *byteOffset;
        hasContent = true;
    }

    // Add source location in debug builds
#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// RefdbException Implementation
// =============================================================================

void RefdbException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// StageFailure Implementation
// =============================================================================

std::string StageFailure::formatStageMessage(const std::string& stage,
                                             const std::string& message) {
    return std::format("stage '{}' failed: {}", stage, message);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw ConfigurationError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw ArchiveError(message_);
        case ErrorCode::kCancelled:
            throw CancelledError(message_);
        case ErrorCode::kStageFailure:
        case ErrorCode::kSuccess:
            break;
    }
    // Stage failures carry their stage name in the message already
    throw RefdbException(code_, message_);
}

}  // namespace refdb
