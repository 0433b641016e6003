/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace motion_planner {

namespace config {
struct LoggingConfig;
}

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file
     * @param level Log level (trace, debug, info, warn, error, off)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     */
    static void init(const std::string& log_file = "logs/planner.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5);

    /**
     * Initialize from the logging section of the planner configuration.
     * Replaces a logger created earlier with defaults.
     */
    static void init(const config::LoggingConfig& config);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static void build(const std::string& log_file, const std::string& level,
                      size_t max_size, size_t max_files,
                      bool console_enabled, bool file_enabled);
    static spdlog::level::level_enum parseLevel(const std::string& level);

    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace motion_planner

// Convenience macros
#define LOG_TRACE(...) ::motion_planner::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::motion_planner::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::motion_planner::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::motion_planner::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::motion_planner::Logger::get()->error(__VA_ARGS__)
