/**
 * @file logging.cpp
 * @brief Global logger state and the cli/debug entry points.
 */

#include <rasx/logging.h>

#include "logger_backend.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rasx {

namespace {

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.length(), to);
        pos += to.length();
    }
}

// Windows-style separators and doubled spaces do not make a warning distinct.
std::string NormalizeWarning(std::string s) {
    ReplaceAll(s, "\\", "/");
    ReplaceAll(s, "//", "/");
    while (s.find("  ") != std::string::npos) ReplaceAll(s, "  ", " ");
    return s;
}

//-----------------------------------------------------------------------------
// WarningCollector
//-----------------------------------------------------------------------------
class WarningCollector {
public:
    explicit WarningCollector(std::shared_ptr<LoggerBackend> backend) : backend_(std::move(backend)) {}

    void Add(const std::string& warning) {
        const std::string normalized = NormalizeWarning(warning);
        std::lock_guard<std::mutex> lock(mutex_);
        if (seen_.count(normalized) > 0) {
            return;
        }
        if (pending_.size() < kMaxCollectedWarnings) {
            seen_.insert(normalized);
            pending_.push_back(normalized);
        } else {
            ++overflow_;
        }
        backend_->SetCollectedWarningTotal(++total_);
        backend_->WriteToFileOnly(LogLevel::Warning, normalized);
    }

    void Display() {
        std::vector<std::string> warnings;
        size_t overflow = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            warnings.swap(pending_);
            seen_.clear();
            std::swap(overflow, overflow_);
        }
        if (warnings.empty() || !backend_->Admits(LogLevel::Warning, true)) {
            return;
        }
        backend_->WriteToConsoleOnly(LogLevel::Warning, std::to_string(warnings.size()) +
                                                            (warnings.size() == 1 ? " warning:" : " warnings:"));
        for (const auto& warning : warnings) {
            backend_->WriteToConsoleOnly(LogLevel::Warning, "  - " + warning);
        }
        if (overflow > 0) {
            backend_->WriteToConsoleOnly(LogLevel::Warning,
                                         "  ... " + std::to_string(overflow) + " more in the log file");
        }
    }

    size_t Pending() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    std::shared_ptr<LoggerBackend> backend_;
    std::mutex mutex_;
    std::vector<std::string> pending_;
    std::unordered_set<std::string> seen_;
    size_t overflow_ = 0;
    size_t total_ = 0;
};

//-----------------------------------------------------------------------------
// Global state
//-----------------------------------------------------------------------------
std::mutex g_mutex;
std::shared_ptr<LoggerBackend> g_backend;
std::shared_ptr<WarningCollector> g_warnings;

std::shared_ptr<LoggerBackend> Backend() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_backend;
}

std::shared_ptr<WarningCollector> Warnings() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_warnings;
}

void Emit(LogLevel level, const std::string& message) {
    if (auto backend = Backend()) {
        backend->Write(level, message);
    }
}

} // namespace

bool Initialize(const LoggingConfig& config) {
    auto backend = std::make_shared<LoggerBackend>(config);
    auto warnings = std::make_shared<WarningCollector>(backend);
    std::lock_guard<std::mutex> lock(g_mutex);
    // The previous backend writes its footer when the last holder lets go.
    g_backend = std::move(backend);
    g_warnings = std::move(warnings);
    return true;
}

void Shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_warnings.reset();
    g_backend.reset();
}

bool IsInitialized() noexcept {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_backend != nullptr;
}

std::string GetLogFilePath() {
    auto backend = Backend();
    return backend ? backend->GetLogFilePath() : std::string();
}

namespace cli {

void LogInfo(const std::string& message) { Emit(LogLevel::Info, message); }
void LogSuccess(const std::string& message) { Emit(LogLevel::Success, message); }
void LogWarning(const std::string& message) { Emit(LogLevel::Warning, message); }
void LogError(const std::string& message) { Emit(LogLevel::Error, message); }

void CollectWarning(const std::string& warning_message) {
    if (auto warnings = Warnings()) {
        warnings->Add(warning_message);
    }
}

void DisplayWarnings() {
    if (auto warnings = Warnings()) {
        warnings->Display();
    }
}

size_t CollectedWarningCount() {
    auto warnings = Warnings();
    return warnings ? warnings->Pending() : 0;
}

} // namespace cli

namespace debug {

void LogDebug(const std::string& message) { Emit(LogLevel::Debug, message); }
void LogTrace(const std::string& message) { Emit(LogLevel::Trace, message); }

bool IsDebugEnabled() noexcept {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_backend && (g_backend->Admits(LogLevel::Debug, true) || g_backend->Admits(LogLevel::Debug, false));
}

} // namespace debug

} // namespace rasx
