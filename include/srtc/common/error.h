// =============================================================================
// srtchunk - Error Handling Framework
// =============================================================================
// Error handling for the subtitle ingestion library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - SRTCException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Only ValidationError and ParsingError cross the ingestion boundary.
// IOError and GrammarError are raised by the collaborators behind the
// pipeline and are always wrapped before they reach the caller.
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: Validation error (extension, access, size)
// - 3: Parsing error (read failure, grammar failure)
// =============================================================================

#ifndef SRTC_COMMON_ERROR_H
#define SRTC_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace srtc {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note Values up to kParsingError are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief Input rejected before any content was parsed.
    /// @note Bad extension, inaccessible file, oversized or empty file.
    kValidationError = 2,

    /// @brief Input rejected after validation passed.
    /// @note File vanished before read, read failure, grammar failure.
    kParsingError = 3,

    /// @brief Low-level I/O failure inside the filesystem layer.
    kIOError = 4,

    /// @brief Grammar violation reported by the subtitle grammar.
    kGrammarError = 5,

    /// @brief File not found.
    kFileNotFound = 6,

    /// @brief Invalid argument value.
    kInvalidArgument = 7
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
            return "usage error";
        case ErrorCode::kValidationError:
            return "validation error";
        case ErrorCode::kParsingError:
            return "parsing error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kGrammarError:
            return "grammar error";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
    }
    return "unknown error";
}

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief 1-based line number in the decoded text (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Declared subtitle index of the block being processed.
    std::optional<std::uint64_t> blockIndex;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the line number.
    /// @return Reference to this for method chaining.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Set the block index.
    /// @return Reference to this for method chaining.
    ErrorContext& withBlock(std::uint64_t index) {
        blockIndex = index;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all srtchunk errors.
class SRTCException : public std::exception {
public:
    SRTCException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    SRTCException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~SRTCException() override = default;

    SRTCException(const SRTCException&) = default;
    SRTCException(SRTCException&&) noexcept = default;
    SRTCException& operator=(const SRTCException&) = default;
    SRTCException& operator=(SRTCException&&) noexcept = default;

    /// @brief Get the formatted message including category and context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without category or context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

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

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public SRTCException {
public:
    explicit UsageError(std::string message)
        : SRTCException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : SRTCException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for inputs rejected before parsing (exit code 2).
/// @note Always recoverable by fixing the input.
class ValidationError : public SRTCException {
public:
    explicit ValidationError(std::string message)
        : SRTCException(ErrorCode::kValidationError, std::move(message)) {}

    ValidationError(std::string message, ErrorContext context)
        : SRTCException(ErrorCode::kValidationError, std::move(message), std::move(context)) {}

    /// @brief Construct with the system error that made the file inaccessible.
    ValidationError(std::string message, std::error_code ec, ErrorContext context)
        : SRTCException(ErrorCode::kValidationError, std::move(message), std::move(context)),
          systemError_(ec) {}

    /// @brief Get the underlying system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    std::optional<std::error_code> systemError_;
};

/// @brief Exception for failures after validation passed (exit code 3).
/// @note Carries the file path and the underlying cause.
class ParsingError : public SRTCException {
public:
    explicit ParsingError(std::string message)
        : SRTCException(ErrorCode::kParsingError, std::move(message)) {}

    ParsingError(std::string message, ErrorContext context)
        : SRTCException(ErrorCode::kParsingError, std::move(message), std::move(context)) {}

    /// @brief Construct with the message of the error that caused it.
    ParsingError(std::string message, std::string cause, ErrorContext context)
        : SRTCException(ErrorCode::kParsingError, std::move(message), std::move(context)),
          cause_(std::move(cause)) {}

    /// @brief Get the underlying cause (empty if none).
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

/// @brief Exception for filesystem failures.
/// @note Raised by io::FileSystem implementations only.
class IOError : public SRTCException {
public:
    explicit IOError(std::string message)
        : SRTCException(ErrorCode::kIOError, std::move(message)) {}

    IOError(ErrorCode code, std::string message)
        : SRTCException(code, std::move(message)) {}

    IOError(std::string message, std::error_code ec)
        : SRTCException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(ErrorCode code, std::string message, std::error_code ec)
        : SRTCException(code, formatWithSystemError(message, ec)), systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for grammar violations in subtitle text.
/// @note Raised by io::SubtitleGrammar implementations only.
class GrammarError : public SRTCException {
public:
    explicit GrammarError(std::string message)
        : SRTCException(ErrorCode::kGrammarError, std::move(message)) {}

    GrammarError(std::string message, std::uint64_t lineNumber)
        : SRTCException(ErrorCode::kGrammarError, std::move(message),
                        ErrorContext{}.withLine(lineNumber)),
          lineNumber_(lineNumber) {}

    /// @brief Get the 1-based line number of the offending line (if known).
    [[nodiscard]] std::optional<std::uint64_t> lineNumber() const noexcept { return lineNumber_; }

private:
    std::optional<std::uint64_t> lineNumber_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    explicit Error(const SRTCException& ex) : code_(ex.code()), message_(ex.message()) {}

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

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(const SRTCException& ex) {
    return std::unexpected(Error{ex});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws SRTCException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note Unrecognised std::exception types are reported as parsing errors so
///       that callers only ever see the two ingestion error kinds.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<decltype(func())> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return {};
        } else {
            return func();
        }
    } catch (const SRTCException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kParsingError, ex.what()});
    }
}

}  // namespace srtc

#endif  // SRTC_COMMON_ERROR_H
