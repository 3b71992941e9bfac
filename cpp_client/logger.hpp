#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static void Log(LogLevel level, const std::string& message, const std::string& component = "Client") {
        if (level < threshold_.load()) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        json log_entry;
        log_entry["timestamp"] = GetTimestamp();
        log_entry["level"] = LevelToString(level);
        log_entry["component"] = component;
        log_entry["message"] = message;

        // stdout carries the tool's own output
        std::clog << log_entry.dump() << std::endl;
    }

    static void Debug(const std::string& message, const std::string& component = "Client") {
        Log(LogLevel::DEBUG, message, component);
    }

    static void Info(const std::string& message, const std::string& component = "Client") {
        Log(LogLevel::INFO, message, component);
    }

    static void Warn(const std::string& message, const std::string& component = "Client") {
        Log(LogLevel::WARN, message, component);
    }

    static void Error(const std::string& message, const std::string& component = "Client") {
        Log(LogLevel::ERROR, message, component);
    }

    static void Fatal(const std::string& message, const std::string& component = "Client") {
        Log(LogLevel::FATAL, message, component);
    }

    static void SetLevel(LogLevel level) {
        threshold_.store(level);
    }

    // Unknown names leave the threshold untouched and return false.
    static bool SetLevel(const std::string& name) {
        if (name == "DEBUG") SetLevel(LogLevel::DEBUG);
        else if (name == "INFO") SetLevel(LogLevel::INFO);
        else if (name == "WARN") SetLevel(LogLevel::WARN);
        else if (name == "ERROR") SetLevel(LogLevel::ERROR);
        else if (name == "FATAL") SetLevel(LogLevel::FATAL);
        else return false;
        return true;
    }

private:
    static inline std::mutex mutex_;
    static inline std::atomic<LogLevel> threshold_{LogLevel::INFO};

    static std::string LevelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    static std::string GetTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm_utc{};
        gmtime_r(&time_t_now, &tm_utc);

        std::stringstream ss;
        ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << "Z";
        return ss.str();
    }
};

#endif // LOGGER_HPP
