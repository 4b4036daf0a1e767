/**
 * @file logger.hpp
 * @brief Logging utilities for retrykit.
 *
 * Provides a singleton Logger class, level name helpers and logging macros.
 * The retry loop itself never logs; callers opt in through logAttempts()
 * or by logging from their own notify hooks.
 *
 * @date 2025
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <optional>
#include <cctype>
#include <iostream>

namespace retrykit {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error };

    /**
     * @brief Get the upper-case name of a log level ("TRACE" ... "ERROR").
     */
    inline const char* logLevelName(LogLevel lvl) {
        static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR" };
        return names[static_cast<int>(lvl)];
    }

    /**
     * @brief Parse a log level name, case-insensitively.
     * @param name Level name such as "debug" or "WARN"
     * @return The level, or std::nullopt if the name is unknown
     */
    inline std::optional<LogLevel> parseLogLevel(std::string_view name) {
        std::string up(name);
        for (auto& c : up) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        for (int i = 0; i <= static_cast<int>(LogLevel::Error); ++i) {
            auto lvl = static_cast<LogLevel>(i);
            if (up == logLevelName(lvl)) return lvl;
        }
        if (up == "WARNING") return LogLevel::Warn;
        return std::nullopt;
    }

    /**
     * @class Logger
     * @brief Singleton logger class for retrykit.
     *
     * Provides thread-safe logging with customizable log sinks and log levels.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         * @return Reference to the Logger instance
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level.
         * @param lvl LogLevel to set
         */
        void setLevel(LogLevel lvl) {
            std::scoped_lock lk(m_);
            level_ = lvl;
        }

        LogLevel level() const {
            std::scoped_lock lk(m_);
            return level_;
        }

        /**
         * @brief Set a custom log sink function.
         *
         * Passing an empty function restores the default stderr sink.
         *
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = s ? std::move(s) : defaultSink();
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            std::scoped_lock lk(m_);
            if (lvl < level_) return;
            sink_(lvl, msg);
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            /* default sink → stderr, stdout belongs to the host program */
            return [](LogLevel l, const std::string& m) {
                std::cerr << "[retrykit][" << logLevelName(l) << "] " << m << '\n';
            };
        }

        mutable std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

    /**
     * @def LOG_TRACE
     * @brief Log a message at TRACE level.
     */
    /**
     * @def LOG_DEBUG
     * @brief Log a message at DEBUG level.
     */
    /**
     * @def LOG_INFO
     * @brief Log a message at INFO level.
     */
    /**
     * @def LOG_WARN
     * @brief Log a message at WARN level.
     */
    /**
     * @def LOG_ERROR
     * @brief Log a message at ERROR level.
     */
#define LOG_TRACE(msg) ::retrykit::Logger::inst().log(::retrykit::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::retrykit::Logger::inst().log(::retrykit::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::retrykit::Logger::inst().log(::retrykit::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::retrykit::Logger::inst().log(::retrykit::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::retrykit::Logger::inst().log(::retrykit::LogLevel::Error, msg)
}
