// =============================================================================
// srtchunk - Error Handling Framework Implementation
// =============================================================================

#include "srtc/common/error.h"

#include <format>
#include <sstream>

namespace srtc {

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

    if (lineNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "line: " << *lineNumber;
        hasContent = true;
    }

    if (blockIndex.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "block: " << *blockIndex;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// SRTCException Implementation
// =============================================================================

void SRTCException::formatWhat() {
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
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            throw UsageError(message_);
        case ErrorCode::kValidationError:
            throw ValidationError(message_);
        case ErrorCode::kParsingError:
            throw ParsingError(message_);
        case ErrorCode::kIOError:
        case ErrorCode::kFileNotFound:
            throw IOError(code_, message_);
        case ErrorCode::kGrammarError:
            throw GrammarError(message_);
        case ErrorCode::kSuccess:
            throw SRTCException(ErrorCode::kSuccess, message_);
    }
    throw SRTCException(code_, message_);
}

}  // namespace srtc
