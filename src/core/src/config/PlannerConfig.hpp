/**
 * @file PlannerConfig.hpp
 * @brief Planner configuration data structures (file view)
 */

#pragma once

#include "../trajectory/PlannerTypes.hpp"
#include <string>
#include <vector>

namespace motion_planner {
namespace config {

/**
 * Per-axis kinematic limits
 */
struct AxisConfig {
    std::string name;                 // "x", "y" or "z"
    double max_velocity = 0;          // mm/s
    double max_acceleration = 0;      // mm/s²
    double max_jerk = 0;              // mm/s³, s_curve only
};

/**
 * Corner tolerance policy
 */
struct ToleranceConfig {
    std::string mode = "exact_path";  // exact_stop | exact_path | blend
    double max_deviation = 0.0;       // mm, blend only
};

/**
 * Setpoint emission
 */
struct EmitterConfig {
    int tick_hz = 1000;
    double buffer_horizon_s = 0.05;
};

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/planner.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
    bool file_enabled = true;
};

/**
 * Complete planner configuration
 */
struct PlannerConfig {
    size_t lookahead = 16;
    size_t queue_capacity = 64;
    double colinear_tolerance = 1e-6;   // rad
    std::string profile = "trapezoidal";  // trapezoidal | s_curve
    ToleranceConfig tolerance;
    std::vector<AxisConfig> axes;
    EmitterConfig emitter;
    LoggingConfig logging;

    /**
     * Check values that cannot be planned with
     * @param error Set to the first problem found
     */
    bool isValid(std::string& error) const;

    trajectory::PlanningContext toPlanningContext() const;
    trajectory::ToleranceMode toleranceMode() const;

    double tickPeriod() const { return emitter.tick_hz > 0 ? 1.0 / emitter.tick_hz : 0.0; }
};

/**
 * Parse an axis name ("x", "X", ...)
 * @return false for unknown names
 */
bool parseAxisName(const std::string& name, trajectory::Axis& axis);

/**
 * Parse a tolerance mode name
 * @return false for unknown names
 */
bool parseToleranceMode(const std::string& name, trajectory::ToleranceType& type);

/**
 * Parse a velocity profile name
 * @return false for unknown names
 */
bool parseProfileType(const std::string& name, trajectory::ProfileType& type);

} // namespace config
} // namespace motion_planner
