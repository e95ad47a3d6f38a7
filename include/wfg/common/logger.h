// =============================================================================
// wfgen - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// One process-wide logger writes to the console and, for long-running job
// hosts, to an appended or size-rotated log file.
//
// Usage:
//   wfg::log::init({.level = wfg::log::Level::kInfo, .logFile = "wfg.log"});
//   WFG_LOG_INFO("Generated waveform for subject {}", subjectId);
//
// The WFG_LOG_* macros are no-ops until init() has been called, so library
// code can log unconditionally (tests never start a backend).
// =============================================================================

#ifndef WFG_COMMON_LOGGER_H
#define WFG_COMMON_LOGGER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include "wfg/common/error.h"

namespace wfg::log {

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

/// @brief How an existing log file is treated when the logger starts.
enum class FileMode {
    kAppend,    ///< Keep earlier runs; one file accumulates every job.
    kTruncate   ///< Start the file empty on each run.
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Sink setup for one process.
///
/// The console sink is always installed. A file sink is added when
/// `logFile` is set; with `rotateBytes` > 0 it becomes a size-rotated sink
/// keeping `maxBackups` older files next to it (`wfg.1.log`, `wfg.2.log`).
struct Config {
    Level level = Level::kInfo;
    std::filesystem::path logFile;
    FileMode fileMode = FileMode::kAppend;
    std::size_t rotateBytes = 0;
    std::uint32_t maxBackups = 5;

    /// @brief Check rotation settings against the file path.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Start the Quill backend and install the configured sinks.
/// @throws UsageError if the configuration is invalid.
/// @note Later calls are ignored until shutdown().
void init(const Config& config);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Path of the file sink, empty when logging to the console only.
[[nodiscard]] std::filesystem::path activeLogFile();

/// @brief Block until every queued message has reached its sinks.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name (case-insensitive, accepts warn/fatal).
/// @return Corresponding log level, defaults to kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Map the CLI's -q / -v / -vv flags to a level. Quiet wins.
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace wfg::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define WFG_LOG_IMPL_(quillMacro, fmt, ...)                                   \
    do {                                                                      \
        if (quill::Logger* wfgLogger_ = wfg::log::logger()) {                 \
            quillMacro(wfgLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                     \
    } while (0)

/// @brief Log a trace message.
#define WFG_LOG_TRACE(fmt, ...) WFG_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define WFG_LOG_DEBUG(fmt, ...) WFG_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define WFG_LOG_INFO(fmt, ...) WFG_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define WFG_LOG_WARNING(fmt, ...) WFG_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define WFG_LOG_ERROR(fmt, ...) WFG_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define WFG_LOG_CRITICAL(fmt, ...) WFG_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // WFG_COMMON_LOGGER_H
