/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "PlannerConfig.hpp"

namespace motion_planner {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Loads the planner configuration from YAML. A failed load keeps the
 * previously loaded configuration. Thread-safe for reading after
 * initialization.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load planner configuration from YAML file
     * @param filepath Path to planner_config.yaml
     * @return true if loaded and valid
     */
    bool loadPlannerConfig(const std::string& filepath);

    /**
     * Load planner configuration from YAML text
     * @return true if loaded and valid
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Get planner configuration (const reference)
     */
    const PlannerConfig& plannerConfig() const { return m_planner_config; }

    /**
     * Check if configuration is loaded and valid
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * Get configuration as JSON (for external observers)
     */
    std::string plannerConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    bool parse(const std::string& source, const std::string& yaml, bool fromFile);

    PlannerConfig m_planner_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace motion_planner
