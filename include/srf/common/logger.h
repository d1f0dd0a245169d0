// =============================================================================
// srf - Logger Module
// =============================================================================
// Asynchronous logging for the record library, backed by Quill.
//
// The library itself only emits debug/warning diagnostics (skips, window
// summaries, tolerated premature ends). Nothing is logged until the host
// application calls init(); before that the SRF_LOG_* macros are no-ops, so
// embedding the codec never forces a logging backend on the caller.
//
// Usage:
//   srf::log::init("srf.log", srf::log::Level::kDebug);
//   SRF_LOG_INFO("copied {} records", n);
// =============================================================================

#ifndef SRF_COMMON_LOGGER_H
#define SRF_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace srf::log {

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
    std::string loggerName = "srf";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Calling init() a second time is a no-op until shutdown().
void init(const Config& config);

/// @brief Initialize the global logger with a log file and level.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the Quill logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert srf::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace srf::log

// =============================================================================
// Convenience Macros
// =============================================================================
// Each macro resolves the logger once and skips the statement entirely while
// the logger is not initialized.

#define SRF_LOG_IMPL_(QUILL_MACRO, fmt, ...)                                   \
    do {                                                                       \
        if (quill::Logger* srfLogger_ = srf::log::logger()) {                  \
            QUILL_MACRO(srfLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                      \
    } while (0)

/// @brief Log a trace message.
#define SRF_LOG_TRACE(fmt, ...) SRF_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define SRF_LOG_DEBUG(fmt, ...) SRF_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define SRF_LOG_INFO(fmt, ...) SRF_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define SRF_LOG_WARNING(fmt, ...) SRF_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define SRF_LOG_ERROR(fmt, ...) SRF_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define SRF_LOG_CRITICAL(fmt, ...) SRF_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SRF_COMMON_LOGGER_H
