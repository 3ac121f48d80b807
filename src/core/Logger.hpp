#pragma once

/**
 * Logger.hpp
 * 
 * Centralized logging for the download daemon.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace lectern::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logger class - Thread-safe singleton logger
 * 
 * Warnings and above go to stderr until initialize() installs the
 * configured sinks:
 * - Colored stderr output at the configured level
 * - Rotating file output with every level (optional)
 */
class Logger {
public:
    /**
     * Get singleton instance
     * @return Reference to Logger instance
     */
    static Logger& instance() {
        static Logger instance;
        return instance;
    }
    
    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (empty = console only)
     */
    void initialize(LogLevel level = LogLevel::Info, 
                   const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;
            
            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(consoleSink);
            
            if (!logDir.empty()) {
                auto logPath = std::filesystem::path(logDir) / "lectern.log";
                std::filesystem::create_directories(logPath.parent_path());
                
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    false
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }
            
            m_logger = std::make_shared<spdlog::logger>("lectern", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);
            
            spdlog::set_default_logger(m_logger);
            spdlog::flush_every(std::chrono::seconds(3));
            
        } catch (const std::exception& ex) {
            // spdlog_ex or filesystem_error; fall back to console only
            m_logger = std::make_shared<spdlog::logger>(
                "lectern_fallback",
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            m_logger->error("Logger initialization failed: {}", ex.what());
        }
    }
    
    /**
     * Flush all log sinks
     */
    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }
    
    /**
     * Log one message; arguments are only formatted when the level is enabled
     */
    template<typename... Args>
    void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger && m_logger->should_log(level)) {
            m_logger->log(level, fmt, std::forward<Args>(args)...);
        }
    }
    
    /**
     * Parse a level name as written in the config file
     * @param name "trace", "debug", "info", "warn", "error", "critical" or "off"
     * @return Matching level, Info for unknown names
     */
    static LogLevel parseLevel(const std::string& name) {
        if (name == "trace")    return LogLevel::Trace;
        if (name == "debug")    return LogLevel::Debug;
        if (name == "warn")     return LogLevel::Warn;
        if (name == "error")    return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off")      return LogLevel::Off;
        return LogLevel::Info;
    }

private:
    Logger()
        : m_logger(std::make_shared<spdlog::logger>(
              "lectern", std::make_shared<spdlog::sinks::stderr_color_sink_mt>())) {
        m_logger->set_level(spdlog::level::warn);
    }
    
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
    }
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace lectern::core

// Convenience macros
#define LOG_TRACE(...)    lectern::core::Logger::instance().log(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...)    lectern::core::Logger::instance().log(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...)     lectern::core::Logger::instance().log(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...)     lectern::core::Logger::instance().log(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...)    lectern::core::Logger::instance().log(spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) lectern::core::Logger::instance().log(spdlog::level::critical, __VA_ARGS__)
