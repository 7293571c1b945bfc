/**
 * @file logger_backend.h
 * @brief Console and file sinks behind the RasExplorer logging API.
 */

#pragma once

#include <rasx/logging.h>

#include <array>
#include <fstream>
#include <mutex>
#include <string>

namespace rasx {

/**
 * @brief Owns the sinks, applies thresholds and formats file lines.
 *
 * File lines read "[2024-05-01T12:00:00Z] [INFO] message". The file opens
 * with a header naming the library and HDF5 versions and closes with a
 * footer counting messages per level.
 *
 * @note Writes are serialized by an internal mutex.
 */
class LoggerBackend {
public:
    explicit LoggerBackend(const LoggingConfig& config);

    /// Writes the footer and closes the file.
    ~LoggerBackend();

    LoggerBackend(const LoggerBackend&) = delete;
    LoggerBackend& operator=(const LoggerBackend&) = delete;

    /// Send @p message to every sink whose threshold admits @p level.
    void Write(LogLevel level, const std::string& message);

    /// File sink only (collected warnings are shown on the console later).
    void WriteToFileOnly(LogLevel level, const std::string& message);

    /// Console sink only, no threshold check.
    void WriteToConsoleOnly(LogLevel level, const std::string& message);

    [[nodiscard]] bool Admits(LogLevel level, bool console) const noexcept;

    [[nodiscard]] const LoggingConfig& GetConfig() const noexcept { return config_; }

    [[nodiscard]] bool HasFile() const noexcept { return log_file_.is_open(); }

    /// Empty when the file sink is off or could not be opened.
    [[nodiscard]] std::string GetLogFilePath() const;

    /// Reported in the footer.
    void SetCollectedWarningTotal(size_t total) noexcept;

private:
    bool OpenLogFile();
    void ConsoleLine(LogLevel level, const std::string& message);
    void FileLine(LogLevel level, const std::string& message);
    [[nodiscard]] std::string Header() const;
    [[nodiscard]] std::string Footer() const;

    LoggingConfig config_;
    std::ofstream log_file_;
    mutable std::mutex mutex_;
    std::array<size_t, kNumLogLevels> counts_{};
    size_t collected_warnings_ = 0;
};

} // namespace rasx
