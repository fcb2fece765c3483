#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <sstream>
#include <chrono>
#include <iomanip>

namespace execgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
public:
    static void SetLevel(LogLevel level) {
        min_level_.store(static_cast<int>(level));
    }

    static bool Enabled(LogLevel level) {
        return static_cast<int>(level) >= min_level_.load();
    }

    // Accepts "debug", "info", "warn"/"warning", "error". Returns false for anything else.
    static bool ParseLevel(const std::string& name, LogLevel* level) {
        if (name == "debug") { *level = LogLevel::DEBUG; return true; }
        if (name == "info") { *level = LogLevel::INFO; return true; }
        if (name == "warn" || name == "warning") { *level = LogLevel::WARNING; return true; }
        if (name == "error") { *level = LogLevel::ERROR; return true; }
        return false;
    }

    static void Log(LogLevel level, const std::string& message) {
        if (!Enabled(level)) return;

        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time, &local_tm);

        std::ostream& out = level == LogLevel::ERROR ? std::cerr : std::cout;
        out << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "[DEBUG] "; break;
            case LogLevel::INFO: out << "[INFO] "; break;
            case LogLevel::WARNING: out << "[WARN] "; break;
            case LogLevel::ERROR: out << "[ERROR] "; break;
        }

        out << message << std::endl;
    }

    template<typename... Args>
    static void Debug(Args... args) {
        if (!Enabled(LogLevel::DEBUG)) return;
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::DEBUG, ss.str());
    }

    template<typename... Args>
    static void Info(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::INFO, ss.str());
    }

    template<typename... Args>
    static void Warn(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::WARNING, ss.str());
    }

    template<typename... Args>
    static void Error(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::ERROR, ss.str());
    }

private:
    static std::mutex mutex_;
    static std::atomic<int> min_level_;
};

inline std::mutex Logger::mutex_;
inline std::atomic<int> Logger::min_level_{static_cast<int>(LogLevel::INFO)};

} // namespace execgate
