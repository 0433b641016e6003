/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include "../config/PlannerConfig.hpp"
#include <spdlog/sinks/null_sink.h>
#include <algorithm>
#include <vector>
#include <filesystem>
#include <iostream>

namespace motion_planner {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
bool Logger::s_initialized = false;

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files) {
    if (s_initialized) {
        return;
    }
    build(log_file, level, max_size, max_files, true, true);
}

void Logger::init(const config::LoggingConfig& config) {
    size_t max_size = static_cast<size_t>(std::max(config.max_size_mb, 1)) * 1024 * 1024;
    size_t max_files = static_cast<size_t>(std::max(config.max_files, 1));
    build(config.file, config.level, max_size, max_files,
          config.console_enabled, config.file_enabled);
}

spdlog::level::level_enum Logger::parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void Logger::build(const std::string& log_file, const std::string& level,
                   size_t max_size, size_t max_files,
                   bool console_enabled, bool file_enabled) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        if (console_enabled) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        // File sink (rotating)
        if (file_enabled) {
            std::filesystem::path log_path(log_file);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_size, max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        auto logger = std::make_shared<spdlog::logger>("motion_planner", sinks.begin(), sinks.end());
        logger->set_level(parseLevel(level));

        // Flush on warn or above
        logger->flush_on(spdlog::level::warn);

        s_logger = logger;
        spdlog::set_default_logger(s_logger);
        s_initialized = true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    }

    if (!s_logger) {
        // Keep LOG_* usable when the file sink cannot be opened
        s_logger = std::make_shared<spdlog::logger>(
            "motion_planner", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        s_initialized = true;
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!s_initialized) {
        init(); // Initialize with defaults
    }
    return s_logger;
}

} // namespace motion_planner
