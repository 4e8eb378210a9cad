// =============================================================================
// cidc-upload - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// One process-wide logger is created by main() before any command runs.
// Console output always goes through Quill; an optional file sink keeps a
// history of upload runs across invocations.
//
// Usage:
//   cidc::log::init(cidc::log::Config::fromVerbosity(1, false));
//   CIDC_LOG_INFO("Parsed {} manifest records", count);
// =============================================================================

#ifndef CIDC_COMMON_LOGGER_H
#define CIDC_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace cidc::log {

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
    std::string loggerName = "cidc";

    /// @brief Derive a configuration from the global -v / -q flags.
    /// @param verbosity Number of -v flags given.
    /// @param quiet True when -q was given; wins over verbosity.
    [[nodiscard]] static Config fromVerbosity(int verbosity, bool quiet);
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger. Later calls are no-ops.
void init(const Config& config);

/// @brief Initialize the global logger with a file and a level.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @note Falls back to a default console logger when init() was never called
///       (library users and unit tests).
[[nodiscard]] quill::Logger* logger();

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until all queued messages are written.
void flush();

/// @brief Flush and stop the Quill backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive, defaults to kInfo).
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace cidc::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define CIDC_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(cidc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CIDC_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(cidc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CIDC_LOG_INFO(fmt, ...) \
    LOG_INFO(cidc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CIDC_LOG_WARNING(fmt, ...) \
    LOG_WARNING(cidc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CIDC_LOG_ERROR(fmt, ...) \
    LOG_ERROR(cidc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define CIDC_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(cidc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // CIDC_COMMON_LOGGER_H
