/**
 * @file logger_backend.cpp
 * @brief Implementation of LoggerBackend.
 */

#include <rasx/config.h>
#include "logger_backend.h"

#include <H5public.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace rasx {

namespace {

const char* const kRule = "============================================================\n";

std::string UtcNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &now);
#else
    gmtime_r(&now, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string Hdf5Version() {
    unsigned major = 0, minor = 0, release = 0;
    if (H5get_libversion(&major, &minor, &release) < 0) {
        return "unknown";
    }
    std::ostringstream oss;
    oss << major << "." << minor << "." << release;
    return oss.str();
}

const char* ColorFor(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Trace:
    case LogLevel::Debug: return "\033[90m";
    case LogLevel::Info: return "\033[36m";
    case LogLevel::Success: return "\033[32m";
    case LogLevel::Warning: return "\033[33m";
    case LogLevel::Error: return "\033[31m";
    }
    return "\033[37m";
}

} // namespace

const char* LogLevelName(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Success: return "SUCCESS";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

LoggerBackend::LoggerBackend(const LoggingConfig& config) : config_(config) {
    if (config_.enable_file_output && !config_.log_file_path.empty()) {
        OpenLogFile();
    }
}

LoggerBackend::~LoggerBackend() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_ << Footer();
        log_file_.close();
    }
}

void LoggerBackend::Write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[static_cast<size_t>(level)]++;
    if (config_.enable_cli_output && Admits(level, true)) {
        ConsoleLine(level, message);
    }
    if (log_file_.is_open() && Admits(level, false)) {
        FileLine(level, message);
    }
}

void LoggerBackend::WriteToFileOnly(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open() && Admits(level, false)) {
        counts_[static_cast<size_t>(level)]++;
        FileLine(level, message);
    }
}

void LoggerBackend::WriteToConsoleOnly(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_cli_output) {
        ConsoleLine(level, message);
    }
}

bool LoggerBackend::Admits(LogLevel level, bool console) const noexcept {
    if (config_.enable_debug_logging && level <= LogLevel::Debug) {
        return true;
    }
    const LogLevel threshold = console ? config_.console_level : config_.file_level;
    return static_cast<int>(level) >= static_cast<int>(threshold);
}

std::string LoggerBackend::GetLogFilePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_file_.is_open() ? config_.log_file_path : std::string();
}

void LoggerBackend::SetCollectedWarningTotal(size_t total) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    collected_warnings_ = total;
}

bool LoggerBackend::OpenLogFile() {
    const std::filesystem::path parent = std::filesystem::path(config_.log_file_path).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    if (ec) {
        std::cerr << "Could not create log directory " << parent.string() << ": " << ec.message() << std::endl;
        return false;
    }

    log_file_.open(config_.log_file_path, std::ios::out | std::ios::trunc);
    if (!log_file_.is_open()) {
        std::cerr << "Could not open log file: " << config_.log_file_path << std::endl;
        return false;
    }
    log_file_ << Header();
    log_file_.flush();
    return true;
}

void LoggerBackend::ConsoleLine(LogLevel level, const std::string& message) {
    // stdout stays clean for serialized results.
    std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;
    if (config_.enable_colors) {
        out << ColorFor(level) << message << "\033[0m" << std::endl;
    } else {
        out << message << std::endl;
    }
}

void LoggerBackend::FileLine(LogLevel level, const std::string& message) {
    log_file_ << "[" << UtcNow() << "] [" << LogLevelName(level) << "] " << message << std::endl;
}

std::string LoggerBackend::Header() const {
    std::ostringstream ss;
    ss << kRule;
    ss << " RasExplorer Log\n";
    ss << kRule;
    ss << " RasExplorer version: " << RASX_VERSION << " (" << RASX_BUILD_TYPE << ")\n";
    ss << " HDF5 library:        " << Hdf5Version() << "\n";
    if (!config_.session_label.empty()) {
        ss << " Session:             " << config_.session_label << "\n";
    }
    ss << " Log started:         " << UtcNow() << "\n";
    ss << kRule;
    return ss.str();
}

std::string LoggerBackend::Footer() const {
    std::ostringstream ss;
    ss << kRule;
    ss << " Messages:";
    for (size_t i = 0; i < kNumLogLevels; ++i) {
        if (counts_[i] > 0) {
            ss << " " << LogLevelName(static_cast<LogLevel>(i)) << "=" << counts_[i];
        }
    }
    ss << "\n";
    ss << " Collected warnings:  " << collected_warnings_ << "\n";
    ss << " Log ended:           " << UtcNow() << "\n";
    ss << kRule;
    return ss.str();
}

} // namespace rasx
