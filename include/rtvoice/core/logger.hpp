#pragma once

#include <string>
#include <string_view>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace rtvoice::core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Unknown names fall back to INFO.
LogLevel parseLogLevel(std::string_view name);
const char* logLevelName(LogLevel level);

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(const std::string& format, Args&&... args) {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    // Placeholder substitution tanpa timestamp, dipakai juga oleh tests
    template<typename... Args>
    static std::string format(const std::string& format, Args&&... args) {
        return formatString(format, std::forward<Args>(args)...);
    }

private:
    static LogLevel current_level_;
    static std::mutex mutex_;

    template<typename... Args>
    static void log(LogLevel level, const std::string& format, Args&&... args) {
        if (level < getLevel()) return;

        // Format message sebelum lock supaya operator<< tidak berjalan di dalam critical section
        std::string message = formatString(format, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();

        const char* level_str = "";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBUG"; break;
            case LogLevel::INFO:  level_str = "INFO "; break;
            case LogLevel::WARN:  level_str = "WARN "; break;
            case LogLevel::ERROR: level_str = "ERROR"; break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[" << oss.str() << "] [" << level_str << "] " << message << std::endl;
    }

    template<typename T>
    static std::string formatString(const std::string& format, T&& value) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string result = format;
            result.replace(pos, 2, oss.str());
            return result;
        }
        return format;
    }

    template<typename T, typename... Args>
    static std::string formatString(const std::string& format, T&& value, Args&&... args) {
        size_t pos = format.find("{}");
        if (pos != std::string::npos) {
            std::ostringstream oss;
            oss << value;
            std::string head = format.substr(0, pos) + oss.str();
            // Sisa format diproses terpisah agar "{}" di dalam value tidak ikut diganti
            return head + formatString(format.substr(pos + 2), std::forward<Args>(args)...);
        }
        return format;
    }

    static std::string formatString(const std::string& format) {
        return format;
    }
};

} // namespace rtvoice::core
