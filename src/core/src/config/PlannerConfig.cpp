/**
 * @file PlannerConfig.cpp
 * @brief Conversion of the file view into the runtime planning context
 */

#include "PlannerConfig.hpp"
#include <algorithm>
#include <cctype>

namespace motion_planner {
namespace config {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

bool parseAxisName(const std::string& name, trajectory::Axis& axis) {
    std::string lower = toLower(name);
    if (lower == "x") { axis = trajectory::Axis::X; return true; }
    if (lower == "y") { axis = trajectory::Axis::Y; return true; }
    if (lower == "z") { axis = trajectory::Axis::Z; return true; }
    return false;
}

bool parseToleranceMode(const std::string& name, trajectory::ToleranceType& type) {
    std::string lower = toLower(name);
    if (lower == "exact_stop") { type = trajectory::ToleranceType::EXACT_STOP; return true; }
    if (lower == "exact_path") { type = trajectory::ToleranceType::EXACT_PATH; return true; }
    if (lower == "blend") { type = trajectory::ToleranceType::BLEND; return true; }
    return false;
}

bool parseProfileType(const std::string& name, trajectory::ProfileType& type) {
    std::string lower = toLower(name);
    if (lower == "trapezoidal") { type = trajectory::ProfileType::TRAPEZOIDAL; return true; }
    if (lower == "s_curve") { type = trajectory::ProfileType::S_CURVE; return true; }
    return false;
}

trajectory::ToleranceMode PlannerConfig::toleranceMode() const {
    trajectory::ToleranceType type = trajectory::ToleranceType::EXACT_PATH;
    parseToleranceMode(tolerance.mode, type);
    if (type == trajectory::ToleranceType::BLEND) {
        return trajectory::ToleranceMode::blend(tolerance.max_deviation);
    }
    return {type, 0.0};
}

trajectory::PlanningContext PlannerConfig::toPlanningContext() const {
    trajectory::PlanningContext context;
    for (const auto& axisConfig : axes) {
        trajectory::Axis axis;
        if (parseAxisName(axisConfig.name, axis)) {
            context.axisLimits[axis] = {axisConfig.max_velocity, axisConfig.max_acceleration,
                                        axisConfig.max_jerk};
        }
    }
    parseProfileType(profile, context.profile);
    context.tolerance = toleranceMode();
    context.colinearTolerance = colinear_tolerance;
    context.lookahead = lookahead;
    return context;
}

bool PlannerConfig::isValid(std::string& error) const {
    for (const auto& axisConfig : axes) {
        trajectory::Axis axis;
        if (!parseAxisName(axisConfig.name, axis)) {
            error = "unknown axis '" + axisConfig.name + "'";
            return false;
        }
    }

    trajectory::ToleranceType type;
    if (!parseToleranceMode(tolerance.mode, type)) {
        error = "unknown tolerance mode '" + tolerance.mode + "'";
        return false;
    }

    trajectory::ProfileType profileType;
    if (!parseProfileType(profile, profileType)) {
        error = "unknown velocity profile '" + profile + "'";
        return false;
    }

    if (queue_capacity == 0) {
        error = "queue capacity must be positive";
        return false;
    }
    if (emitter.tick_hz <= 0) {
        error = "emitter tick rate must be positive";
        return false;
    }
    if (!(emitter.buffer_horizon_s >= 0)) {
        error = "emitter buffer horizon must be non-negative";
        return false;
    }

    return toPlanningContext().validate(error);
}

} // namespace config
} // namespace motion_planner
