// =============================================================================
// ziso - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// Usage:
//   ziso::log::init("ziso.log", ziso::log::Level::kInfo);
//   ZISO_LOG_INFO("Compressed {} blocks", blockCount);
//
// The ZISO_LOG_* macros are no-ops until init() has been called, so library
// code can log unconditionally (unit tests never start the backend).
// =============================================================================

#ifndef ZISO_COMMON_LOGGER_H
#define ZISO_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace ziso::log {

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Logger settings derived from the global command-line flags.
struct Config {
    /// @brief Optional log file; it receives the same records as the console.
    std::string logFile;

    /// @brief Minimum level written to every sink.
    Level level = Level::kInfo;

    /// @brief Write records to the console.
    bool enableConsole = true;
};

/// @brief Map -v / -q flags onto a level.
/// @note quiet wins over any verbosity: errors only.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

/// @brief Start the backend and create the "ziso" logger.
/// @note Later calls are ignored until shutdown().
void init(const Config& config);

/// @brief Shorthand for init(Config) with console output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Global logger, nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued records reach the sinks.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace ziso::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define ZISO_LOG_IMPL_(quillMacro, fmt, ...)                              \
    do {                                                                  \
        if (quill::Logger* zisoLogger_ = ::ziso::log::logger()) {         \
            quillMacro(zisoLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);      \
        }                                                                 \
    } while (false)

/// @brief Log a trace message.
#define ZISO_LOG_TRACE(fmt, ...) ZISO_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define ZISO_LOG_DEBUG(fmt, ...) ZISO_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define ZISO_LOG_INFO(fmt, ...) ZISO_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define ZISO_LOG_WARNING(fmt, ...) ZISO_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define ZISO_LOG_ERROR(fmt, ...) ZISO_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define ZISO_LOG_CRITICAL(fmt, ...) ZISO_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // ZISO_COMMON_LOGGER_H
