// =============================================================================
// linkx - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging from extractor worker threads
//
// Usage:
//   linkx::log::init({.logFile = "run.log", .level = linkx::log::Level::kDebug});
//   LINKX_LOG_INFO("Extracted {} blocks", count);
//
// The LINKX_LOG_* macros are no-ops until init() has been called, so the
// core library can be exercised from tests without a logging backend.
// =============================================================================

#ifndef LINKX_COMMON_LOGGER_H
#define LINKX_COMMON_LOGGER_H

#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace linkx::log {

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

    /// @brief Logger name for identification.
    std::string loggerName = "linkx";
};

/// @brief Map the CLI's -q / -v / -vv flags to a level.
/// @note -q wins over -v; more than two -v behave like -vv.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Start the Quill backend and create the console (and file) logger.
/// @note Call once from main() before the extractor spawns workers.
/// @throws std::exception (from Quill) if the log file cannot be opened.
void init(const Config& config);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

}  // namespace linkx::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define LINKX_LOG_IMPL(quillMacro, fmt, ...)                                 \
    do {                                                                     \
        if (quill::Logger* linkxLogger_ = linkx::log::logger()) {            \
            quillMacro(linkxLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);        \
        }                                                                    \
    } while (false)

/// @brief Log a trace message.
#define LINKX_LOG_TRACE(fmt, ...) LINKX_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define LINKX_LOG_DEBUG(fmt, ...) LINKX_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define LINKX_LOG_INFO(fmt, ...) LINKX_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define LINKX_LOG_WARNING(fmt, ...) LINKX_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define LINKX_LOG_ERROR(fmt, ...) LINKX_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define LINKX_LOG_CRITICAL(fmt, ...) LINKX_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // LINKX_COMMON_LOGGER_H
