/**
 * @file PlannerTypes.cpp
 * @brief Planning context validation
 */

#include "PlannerTypes.hpp"
#include <cmath>
#include <string>

namespace motion_planner {
namespace trajectory {

bool PlanningContext::validate(std::string& error) const {
    if (axisLimits.empty()) {
        error = "axis limits are empty";
        return false;
    }

    for (Axis axis : {Axis::X, Axis::Y, Axis::Z}) {
        auto it = axisLimits.find(axis);
        if (it == axisLimits.end()) {
            error = std::string("no limits configured for axis ") + axisToString(axis);
            return false;
        }

        const AxisLimit& limit = it->second;
        if (!(limit.maxVelocity > 0) || !std::isfinite(limit.maxVelocity)) {
            error = std::string("max velocity of axis ") + axisToString(axis) +
                    " must be positive and finite";
            return false;
        }
        if (!(limit.maxAcceleration > 0) || !std::isfinite(limit.maxAcceleration)) {
            error = std::string("max acceleration of axis ") + axisToString(axis) +
                    " must be positive and finite";
            return false;
        }
        if (profile == ProfileType::S_CURVE &&
            (!(limit.maxJerk > 0) || !std::isfinite(limit.maxJerk))) {
            error = std::string("max jerk of axis ") + axisToString(axis) +
                    " must be positive and finite for s-curve profiles";
            return false;
        }
    }

    if (lookahead == 0) {
        error = "lookahead window must hold at least one segment";
        return false;
    }

    if (!(colinearTolerance >= 0)) {
        error = "colinear tolerance must be non-negative";
        return false;
    }

    if (tolerance.type == ToleranceType::BLEND && !(tolerance.maxDeviation >= 0)) {
        error = "blend deviation must be non-negative";
        return false;
    }

    return true;
}

} // namespace trajectory
} // namespace motion_planner
