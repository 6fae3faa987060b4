#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace lumiere {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output.
 * Safe to call from audio device threads and session worker threads.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @param name Level name
     * @param fallback Returned when name is not recognized
     */
    static LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

#define LOG_DEBUG(msg) lumiere::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) lumiere::Logger::info(msg)
#define LOG_WARN(msg) lumiere::Logger::warn(msg)
#define LOG_ERROR(msg) lumiere::Logger::error(msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) lumiere::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_CODEC(msg) lumiere::Logger::warn(std::string("[Codec] ") + (msg))
#define LOG_SESSION(msg) lumiere::Logger::info(std::string("[Session] ") + (msg))
#define LOG_TOOL(msg) lumiere::Logger::info(std::string("[Tool] ") + (msg))
#define LOG_TRANSPORT(msg) lumiere::Logger::info(std::string("[Transport] ") + (msg))

} // namespace lumiere
