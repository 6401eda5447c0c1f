// =============================================================================
// srtchunk - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// The SRTC_LOG_* macros are no-ops until init() has been called, so the
// ingestion library can be embedded or unit-tested without a backend thread.
//
// Usage:
//   srtc::log::init("srtc.log", srtc::log::Level::kInfo);
//   SRTC_LOG_INFO("Parsed {} chunks", chunks.size());
// =============================================================================

#ifndef SRTC_COMMON_LOGGER_H
#define SRTC_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace srtc::log {

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

    /// @brief Enable console (stdout) output.
    /// @note With this off and no logFile, init() creates no logger at all.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "srtc";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Call once at application startup. Repeated calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level.
/// @param levelStr String representation (case-insensitive).
/// @return Corresponding log level, defaults to kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace srtc::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define SRTC_LOG_IMPL_(macro, fmt, ...)                                  \
    do {                                                                 \
        if (quill::Logger* srtcLogger_ = srtc::log::logger()) {          \
            macro(srtcLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                \
    } while (false)

/// @brief Log a trace message.
#define SRTC_LOG_TRACE(fmt, ...) SRTC_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define SRTC_LOG_DEBUG(fmt, ...) SRTC_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define SRTC_LOG_INFO(fmt, ...) SRTC_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define SRTC_LOG_WARNING(fmt, ...) SRTC_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define SRTC_LOG_ERROR(fmt, ...) SRTC_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define SRTC_LOG_CRITICAL(fmt, ...) SRTC_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SRTC_COMMON_LOGGER_H
