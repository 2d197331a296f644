#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace askai::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Process-wide logger. Writes to stderr so results printed on stdout
    // stay machine-readable.
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

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::clog << "[" << level_to_string(level) << "] "
                      << (context_.empty() ? "" : "[" + context_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
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
    #define LOG_DEBUG(msg) askai::core::logging::Logger::get().log(askai::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  askai::core::logging::Logger::get().log(askai::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  askai::core::logging::Logger::get().log(askai::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) askai::core::logging::Logger::get().log(askai::core::logging::LogLevel::ERROR, msg)

} // namespace askai::core::logging
