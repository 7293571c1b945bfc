/**
 * @file logging.h
 * @brief Logging for the RasExplorer library.
 *
 * Two front doors share one backend: `rasx::cli` for messages meant for
 * whoever drives the analyzer (an RPC host, a shell tool) and `rasx::debug`
 * for traversal tracing. Entries the walker had to skip are collected as
 * warnings and shown together once an operation finishes.
 *
 * @note Nothing is written until Initialize() is called, so a host that
 *       never configures logging gets a silent library.
 * @note Thread-safe after Initialize() returns.
 */

#pragma once

#include <cstddef>
#include <sstream>
#include <string>

namespace rasx {

enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Success = 3, Warning = 4, Error = 5 };

// Keep this in sync with LogLevel.
constexpr size_t kNumLogLevels = static_cast<size_t>(LogLevel::Error) + 1;
static_assert(static_cast<int>(LogLevel::Error) == 5, "Update kNumLogLevels when LogLevel changes.");

/// Distinct warnings kept between two DisplayWarnings() calls; later ones only reach the log file.
constexpr size_t kMaxCollectedWarnings = 256;

/** @return Upper-case level tag as written to the log file ("TRACE", "INFO", ...). */
const char* LogLevelName(LogLevel level) noexcept;

/**
 * @brief Sinks and thresholds for the logger.
 */
struct LoggingConfig {
    std::string log_file_path;                ///< Empty = no file sink
    std::string session_label;                ///< Written to the log header, e.g. the host process name
    bool enable_cli_output = true;            ///< Console sink (stdout, stderr for warnings and errors)
    bool enable_file_output = true;
    bool enable_debug_logging = false;        ///< Let Debug and Trace through regardless of thresholds
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug;
    bool enable_colors = true;                ///< ANSI colors on the console sink
};

/**
 * @brief Install the logging backend, replacing any previous one.
 * @return true once the backend is installed (the file sink may still be off
 *         if its file could not be opened).
 */
[[nodiscard]] bool Initialize(const LoggingConfig& config);

/**
 * @brief Write the log footer and drop the backend. Safe to call repeatedly.
 */
void Shutdown();

[[nodiscard]] bool IsInitialized() noexcept;

/** @return Path of the open log file, or empty when file logging is off. */
[[nodiscard]] std::string GetLogFilePath();

//-----------------------------------------------------------------------------
// User-facing messages
//-----------------------------------------------------------------------------
namespace cli {

void LogInfo(const std::string& message);
void LogSuccess(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);

/**
 * @brief Remember a non-fatal problem (a skipped link, an unreadable dataset).
 *
 * Warnings that differ only in path separators or repeated spaces are kept
 * once. Each new warning goes to the log file right away; the console sees
 * it on the next DisplayWarnings().
 */
void CollectWarning(const std::string& warning_message);

/**
 * @brief Print the collected warnings to the console and start a new list.
 */
void DisplayWarnings();

[[nodiscard]] size_t CollectedWarningCount();

} // namespace cli

//-----------------------------------------------------------------------------
// Developer tracing
//-----------------------------------------------------------------------------
namespace debug {

void LogDebug(const std::string& message);
void LogTrace(const std::string& message);

/** @return true when Debug messages reach at least one sink. */
[[nodiscard]] bool IsDebugEnabled() noexcept;

} // namespace debug

} // namespace rasx

//-----------------------------------------------------------------------------
// Stream macros: LOG_INFO("Read " << n << " values")
//-----------------------------------------------------------------------------

#define RASX_LOG_STREAM(sink, ...) \
    do { \
        std::ostringstream rasx_log_oss__; \
        rasx_log_oss__ << __VA_ARGS__; \
        sink(rasx_log_oss__.str()); \
    } while (0)

// Debug and trace skip formatting entirely when nobody listens.
#define LOG_DEBUG(...) \
    do { \
        if (rasx::debug::IsDebugEnabled()) RASX_LOG_STREAM(rasx::debug::LogDebug, __VA_ARGS__); \
    } while (0)

#define LOG_TRACE(...) \
    do { \
        if (rasx::debug::IsDebugEnabled()) RASX_LOG_STREAM(rasx::debug::LogTrace, __VA_ARGS__); \
    } while (0)

#define LOG_INFO(...) RASX_LOG_STREAM(rasx::cli::LogInfo, __VA_ARGS__)
#define LOG_SUCCESS(...) RASX_LOG_STREAM(rasx::cli::LogSuccess, __VA_ARGS__)
#define LOG_WARNING(...) RASX_LOG_STREAM(rasx::cli::LogWarning, __VA_ARGS__)
#define LOG_ERROR(...) RASX_LOG_STREAM(rasx::cli::LogError, __VA_ARGS__)
