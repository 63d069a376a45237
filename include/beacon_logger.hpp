/**
 * @file beacon_logger.hpp
 * @brief Process-wide logger for MailBeacon
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Lines look like "2025-06-01 12:00:00 [INFO] [TrackingService] message".
 * Output goes to an optional log file (one per process start, flushed per
 * line) and to stdout when console mirroring is on.
 */
#ifndef MAILBEACON_BEACON_LOGGER_HPP
#define MAILBEACON_BEACON_LOGGER_HPP

#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace mailbeacon {

// LOG_ prefix keeps clear of the ERROR macro from WinGDI.h
enum class LogLevel { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

inline const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_TRACE: return "TRACE";
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO: return "INFO";
        case LogLevel::LOG_WARNING: return "WARN";
        case LogLevel::LOG_ERROR: return "ERROR";
        case LogLevel::LOG_FATAL: return "FATAL";
    }
    return "?";
}

/// Accepts the names logLevelName produces plus "WARNING"
inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
    if (name == "WARNING") return LogLevel::LOG_WARNING;
    for (int i = 0; i <= static_cast<int>(LogLevel::LOG_FATAL); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (name == logLevelName(level)) return level;
    }
    return std::nullopt;
}

class BeaconLogger {
public:
    static BeaconLogger& instance() {
        static BeaconLogger logger;
        return logger;
    }

    /**
     * @brief Open mailbeacon_YYYYmmdd_HHMMSS.log under dir
     * @return false when the directory or file cannot be created
     */
    bool initialize(const std::filesystem::path& dir, LogLevel level = LogLevel::LOG_INFO) {
        level_ = level;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) return false;

        std::lock_guard<std::mutex> lock(mtx_);
        if (out_.is_open()) out_.close();
        out_.open(dir / ("mailbeacon_" + stamp("%Y%m%d_%H%M%S") + ".log"), std::ios::app);
        return out_.is_open();
    }

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }
    void setConsoleOutput(bool enabled) { console_ = enabled; }

    bool enabled(LogLevel level) const { return level >= level_.load(); }

    void log(LogLevel level, std::string_view component, std::string_view message) {
        if (!enabled(level)) return;
        std::string line = stamp("%Y-%m-%d %H:%M:%S");
        line.append(" [").append(logLevelName(level)).append("] [");
        line.append(component).append("] ").append(message).append("\n");

        std::lock_guard<std::mutex> lock(mtx_);
        if (out_.is_open()) out_ << line << std::flush;
        if (console_) std::cout << line;
    }

    /// Flush and close the log file; console output is unaffected
    void shutdown() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (out_.is_open()) out_.close();
    }

    BeaconLogger(const BeaconLogger&) = delete;
    BeaconLogger& operator=(const BeaconLogger&) = delete;

private:
    BeaconLogger() = default;

    static std::string stamp(const char* format) {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        char buf[32];
        std::size_t n = std::strftime(buf, sizeof(buf), format, &local);
        return std::string(buf, n);
    }

    std::mutex mtx_;
    std::ofstream out_;
    std::atomic<LogLevel> level_{LogLevel::LOG_INFO};
    std::atomic<bool> console_{false};
};

} // namespace mailbeacon

#define MAILBEACON_LOG(level, comp, msg) \
    mailbeacon::BeaconLogger::instance().log(mailbeacon::LogLevel::level, comp, msg)

#define LOG_TRACE(comp, msg) MAILBEACON_LOG(LOG_TRACE, comp, msg)
#define LOG_DEBUG(comp, msg) MAILBEACON_LOG(LOG_DEBUG, comp, msg)
#define LOG_INFO(comp, msg) MAILBEACON_LOG(LOG_INFO, comp, msg)
#define LOG_WARNING(comp, msg) MAILBEACON_LOG(LOG_WARNING, comp, msg)
#define LOG_ERROR(comp, msg) MAILBEACON_LOG(LOG_ERROR, comp, msg)
#define LOG_FATAL(comp, msg) MAILBEACON_LOG(LOG_FATAL, comp, msg)

#endif // MAILBEACON_BEACON_LOGGER_HPP
