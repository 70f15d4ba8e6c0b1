#pragma once
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace codebox::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole process shares one sink
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Requests run concurrently, so the tag is per calling thread.
        static void set_request_id(const std::string& id) { current_request_id() = id; }
        static const std::string& request_id() { return current_request_id(); }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            // stdout carries the JSON result, so logs go to stderr.
            const std::string& id = current_request_id();
            std::clog << "[" << level_to_string(level) << "] "
                      << (id.empty() ? "" : "[" + id + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;

        static std::string& current_request_id() {
            thread_local std::string id;
            return id;
        }

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }

        std::mutex mutex_;
        LogLevel min_level_ = LogLevel::INFO;
    };

    // Tags every log line of the current thread with a request id until scope exit.
    class ScopedRequestTag {
    public:
        explicit ScopedRequestTag(const std::string& request_id)
            : previous_(Logger::request_id()) {
            Logger::set_request_id(request_id);
        }
        ~ScopedRequestTag() { Logger::set_request_id(previous_); }

        ScopedRequestTag(const ScopedRequestTag&) = delete;
        ScopedRequestTag& operator=(const ScopedRequestTag&) = delete;

    private:
        std::string previous_;
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) codebox::core::logging::Logger::get().log(codebox::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  codebox::core::logging::Logger::get().log(codebox::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  codebox::core::logging::Logger::get().log(codebox::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) codebox::core::logging::Logger::get().log(codebox::core::logging::LogLevel::ERROR, msg)

} // namespace codebox::core::logging
