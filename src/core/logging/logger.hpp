#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace toolgate::core::logging {

    // 1. Log levels. Off silences everything.
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        OFF
    };

    inline std::optional<LogLevel> parse_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        if (text == "off" || text == "none") return LogLevel::OFF;
        return std::nullopt;
    }

    // 2. Global logger. Writes to stderr only: stdout carries the JSON-RPC
    // stream and must never see a diagnostic line.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level == LogLevel::OFF || level < min_level_) {
                return;
            }

            std::cerr << "[toolgate] [" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::WARN;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Call-site macros
    #define LOG_DEBUG(msg) toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) toolgate::core::logging::Logger::get().log(toolgate::core::logging::LogLevel::ERROR, msg)

} // namespace toolgate::core::logging
