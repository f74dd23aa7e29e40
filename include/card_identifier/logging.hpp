#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace card_identifier::logging {

    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    inline std::atomic<int>& minimumLevelStorage() {
        static std::atomic<int> level{static_cast<int>(LogLevel::INFO)};
        return level;
    }

    inline std::mutex& outputMutex() {
        static std::mutex mutex;
        return mutex;
    }

    inline void setMinimumLevel(LogLevel level) {
        minimumLevelStorage().store(static_cast<int>(level));
    }

    inline LogLevel minimumLevel() {
        return static_cast<LogLevel>(minimumLevelStorage().load());
    }

    inline std::string toString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    inline LogLevel stringToLogLevel(const std::string& str) {
        if (str == "debug") return LogLevel::DEBUG;
        if (str == "info") return LogLevel::INFO;
        if (str == "warning") return LogLevel::WARNING;
        if (str == "error") return LogLevel::ERROR;
        throw std::runtime_error("Unknown log level: " + str);
    }

    inline void log(LogLevel level, const std::string& message) {
        if (static_cast<int>(level) < minimumLevelStorage().load()) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const auto time_t = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::ostringstream line;
        line << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "] "
             << "[" << toString(level) << "] " << message;

        std::lock_guard<std::mutex> lock(outputMutex());
        if (level >= LogLevel::WARNING) {
            std::cerr << line.str() << std::endl;
        } else {
            std::cout << line.str() << std::endl;
        }
    }

} // namespace card_identifier::logging

#define LOG_DEBUG(msg) ::card_identifier::logging::log(::card_identifier::logging::LogLevel::DEBUG, (msg))
#define LOG_INFO(msg) ::card_identifier::logging::log(::card_identifier::logging::LogLevel::INFO, (msg))
#define LOG_WARNING(msg) ::card_identifier::logging::log(::card_identifier::logging::LogLevel::WARNING, (msg))
#define LOG_ERROR(msg) ::card_identifier::logging::log(::card_identifier::logging::LogLevel::ERROR, (msg))
