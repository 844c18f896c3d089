// =============================================================================
// gzchunk - Logger Module
// =============================================================================
// Low-latency asynchronous logging using the Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging from every pipeline stage
//
// Usage:
//   gzc::log::init("gzchunk.log", gzc::log::Level::kInfo);
//   GZC_LOG_INFO("Compressed {} chunks", 42);
//
// The GZC_LOG_* macros are no-ops until init() has been called, so library
// code can log unconditionally.
// =============================================================================

#ifndef GZC_COMMON_LOGGER_H
#define GZC_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace gzc::log {

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
    std::string loggerName = "gzchunk";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Call once from main() before spawning worker threads. Later calls
///       are ignored.
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
/// @note Blocks until all messages are written.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert gzc::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive).
/// @return Corresponding log level, kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace gzc::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define GZC_LOG_IMPL(quillMacro, fmt, ...)                                  \
    do {                                                                    \
        if (quill::Logger* gzcLogger = ::gzc::log::logger()) {              \
            quillMacro(gzcLogger, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                   \
    } while (false)

/// @brief Log a trace message.
#define GZC_LOG_TRACE(fmt, ...) GZC_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define GZC_LOG_DEBUG(fmt, ...) GZC_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define GZC_LOG_INFO(fmt, ...) GZC_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define GZC_LOG_WARNING(fmt, ...) GZC_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define GZC_LOG_ERROR(fmt, ...) GZC_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define GZC_LOG_CRITICAL(fmt, ...) GZC_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // GZC_COMMON_LOGGER_H
