#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace warden::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_min_level(LogLevel level) {
            min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
        }

        LogLevel min_level() const {
            return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
        }

        bool enabled(LogLevel level) const {
            return static_cast<int>(level) >= min_level_.load(std::memory_order_relaxed);
        }

        // Stdout belongs to the CLI reports, so the default sink is stderr.
        // Tests swap in a std::ostringstream; pass nullptr to restore stderr.
        void set_sink(std::ostream* sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = sink != nullptr ? sink : &std::cerr;
        }

        void log(LogLevel level, const std::string& message) {
            if (!enabled(level)) {
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            *sink_ << "[" << level_to_string(level) << "] " << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::ostream* sink_ = &std::cerr;
        std::atomic<int> min_level_{static_cast<int>(LogLevel::INFO)};

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

    // 3. Helper macros. The level check runs before the message expression is
    // evaluated, so suppressed DEBUG lines cost nothing on the validation path.
    #define WARDEN_LOG_AT(level, msg)                                              \
        do {                                                                       \
            if (warden::core::logging::Logger::get().enabled(level)) {             \
                warden::core::logging::Logger::get().log(level, msg);              \
            }                                                                      \
        } while (0)

    #define WARDEN_LOG_DEBUG(msg) WARDEN_LOG_AT(warden::core::logging::LogLevel::DEBUG, msg)
    #define WARDEN_LOG_INFO(msg)  WARDEN_LOG_AT(warden::core::logging::LogLevel::INFO, msg)
    #define WARDEN_LOG_WARN(msg)  WARDEN_LOG_AT(warden::core::logging::LogLevel::WARN, msg)
    #define WARDEN_LOG_ERROR(msg) WARDEN_LOG_AT(warden::core::logging::LogLevel::ERROR, msg)

} // namespace warden::core::logging
