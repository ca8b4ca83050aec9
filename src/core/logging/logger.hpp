#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace keel::core::logging {

    // 1. Log levels, in increasing severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline bool parse_log_level(const std::string& text, LogLevel& out) {
        if (text == "debug") { out = LogLevel::DEBUG; return true; }
        if (text == "info")  { out = LogLevel::INFO;  return true; }
        if (text == "warn")  { out = LogLevel::WARN;  return true; }
        if (text == "error") { out = LogLevel::ERROR; return true; }
        return false;
    }

    // 2. Global logger shared by every scope and task thread
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_trace_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            trace_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << "[" << level_to_string(level) << "] "
                << (trace_id_.empty() ? "" : "[" + trace_id_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string trace_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros used everywhere else
    #define KEEL_LOG_DEBUG(msg) keel::core::logging::Logger::get().log(keel::core::logging::LogLevel::DEBUG, msg)
    #define KEEL_LOG_INFO(msg)  keel::core::logging::Logger::get().log(keel::core::logging::LogLevel::INFO, msg)
    #define KEEL_LOG_WARN(msg)  keel::core::logging::Logger::get().log(keel::core::logging::LogLevel::WARN, msg)
    #define KEEL_LOG_ERROR(msg) keel::core::logging::Logger::get().log(keel::core::logging::LogLevel::ERROR, msg)

} // namespace keel::core::logging
