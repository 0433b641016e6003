/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace motion_planner {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadPlannerConfig(const std::string& filepath) {
    if (!fs::exists(filepath)) {
        LOG_ERROR("Planner config file not found: {}", filepath);
        return false;
    }

    LOG_INFO("Loading planner config from: {}", filepath);
    return parse(filepath, filepath, true);
}

bool ConfigManager::loadFromString(const std::string& yaml) {
    return parse("<string>", yaml, false);
}

bool ConfigManager::parse(const std::string& source, const std::string& yaml, bool fromFile) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        YAML::Node config = fromFile ? YAML::LoadFile(yaml) : YAML::Load(yaml);
        YAML::Node planner = config["planner"];

        if (!planner) {
            LOG_ERROR("Missing 'planner' section in config ({})", source);
            return false;
        }

        PlannerConfig loaded;
        loaded.lookahead = planner["lookahead"].as<size_t>(16);
        loaded.queue_capacity = planner["queue_capacity"].as<size_t>(64);
        loaded.colinear_tolerance = planner["colinear_tolerance"].as<double>(1e-6);
        loaded.profile = planner["profile"].as<std::string>("trapezoidal");

        // Tolerance policy
        if (planner["tolerance"]) {
            auto tol = planner["tolerance"];
            loaded.tolerance.mode = tol["mode"].as<std::string>("exact_path");
            loaded.tolerance.max_deviation = tol["max_deviation"].as<double>(0.0);
        }

        // Axis limits
        if (planner["axes"]) {
            for (const auto& ax : planner["axes"]) {
                AxisConfig axis;
                axis.name = ax["name"].as<std::string>("");
                axis.max_velocity = ax["max_velocity"].as<double>(0.0);
                axis.max_acceleration = ax["max_acceleration"].as<double>(0.0);
                axis.max_jerk = ax["max_jerk"].as<double>(0.0);
                loaded.axes.push_back(axis);
            }
        }

        // Emitter
        if (planner["emitter"]) {
            auto em = planner["emitter"];
            loaded.emitter.tick_hz = em["tick_hz"].as<int>(1000);
            loaded.emitter.buffer_horizon_s = em["buffer_horizon_s"].as<double>(0.05);
        }

        // Logging
        if (planner["logging"]) {
            auto log = planner["logging"];
            loaded.logging.level = log["level"].as<std::string>("info");
            loaded.logging.file = log["file"].as<std::string>("logs/planner.log");
            loaded.logging.max_size_mb = log["max_size_mb"].as<int>(10);
            loaded.logging.max_files = log["max_files"].as<int>(5);
            loaded.logging.console_enabled = log["console_enabled"].as<bool>(true);
            loaded.logging.file_enabled = log["file_enabled"].as<bool>(true);
        }

        // Validate
        std::string error;
        if (!loaded.isValid(error)) {
            LOG_ERROR("Planner config validation failed ({}): {}", source, error);
            return false;
        }

        m_planner_config = loaded;
        m_loaded = true;

        LOG_INFO("Planner config loaded: lookahead {}, tolerance {}, {} profile, {} axes",
                 m_planner_config.lookahead, m_planner_config.tolerance.mode,
                 m_planner_config.profile, m_planner_config.axes.size());
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in planner config ({}): {}", source, e.what());
        return false;
    }
}

std::string ConfigManager::plannerConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["lookahead"] = m_planner_config.lookahead;
    j["queue_capacity"] = m_planner_config.queue_capacity;
    j["colinear_tolerance"] = m_planner_config.colinear_tolerance;
    j["profile"] = m_planner_config.profile;

    j["tolerance"] = {
        {"mode", m_planner_config.tolerance.mode},
        {"max_deviation", m_planner_config.tolerance.max_deviation}
    };

    j["axes"] = json::array();
    for (const auto& axis : m_planner_config.axes) {
        j["axes"].push_back({
            {"name", axis.name},
            {"max_velocity", axis.max_velocity},
            {"max_acceleration", axis.max_acceleration},
            {"max_jerk", axis.max_jerk}
        });
    }

    j["emitter"] = {
        {"tick_hz", m_planner_config.emitter.tick_hz},
        {"buffer_horizon_s", m_planner_config.emitter.buffer_horizon_s}
    };

    j["logging"] = {
        {"level", m_planner_config.logging.level},
        {"file", m_planner_config.logging.file},
        {"max_size_mb", m_planner_config.logging.max_size_mb},
        {"max_files", m_planner_config.logging.max_files},
        {"console_enabled", m_planner_config.logging.console_enabled},
        {"file_enabled", m_planner_config.logging.file_enabled}
    };

    return j.dump(2);
}

} // namespace config
} // namespace motion_planner
