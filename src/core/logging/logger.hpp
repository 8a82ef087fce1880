#pragma once
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace acpbridge::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline LogLevel parse_level(std::string text, const LogLevel fallback) {
        for (auto& c : text) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return fallback;
    }

    // 2. Global logger. Writes to stderr; stdout is reserved for program output.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context(const std::string& context) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = context;
        }

        void set_min_level(const LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() {
            const char* env_level = std::getenv("ACPBRIDGE_LOG_LEVEL");
            if (env_level != nullptr) {
                min_level_ = parse_level(env_level, LogLevel::INFO);
            }
        }

        mutable std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

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

    // 3. Helper macros
    #define LOG_DEBUG(msg) acpbridge::core::logging::Logger::get().log(acpbridge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  acpbridge::core::logging::Logger::get().log(acpbridge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  acpbridge::core::logging::Logger::get().log(acpbridge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) acpbridge::core::logging::Logger::get().log(acpbridge::core::logging::LogLevel::ERROR, msg)

} // namespace acpbridge::core::logging
