/**
 * @file AxisLimiter.cpp
 * @brief Per-axis limit projection
 */

#include "AxisLimiter.hpp"
#include <algorithm>
#include <cmath>

namespace motion_planner {
namespace trajectory {

AxisLimiter::AxisLimiter(const AxisLimits& limits, bool jerkLimited)
    : jerkLimited_(jerkLimited) {
    for (const auto& [axis, limit] : limits) {
        limits_[static_cast<int>(axis)] = limit;
    }
}

double AxisLimiter::velocityLimit(const Vector3d& direction) const {
    double v = UNLIMITED;
    for (int a = 0; a < NUM_AXES; ++a) {
        double component = std::abs(direction[a]);
        if (component < AXIS_EPSILON) continue;
        v = std::min(v, limits_[a].maxVelocity / component);
    }
    return v;
}

double AxisLimiter::accelerationLimit(const Vector3d& direction) const {
    double acc = UNLIMITED;
    for (int a = 0; a < NUM_AXES; ++a) {
        double component = std::abs(direction[a]);
        if (component < AXIS_EPSILON) continue;
        acc = std::min(acc, limits_[a].maxAcceleration / component);
    }
    return acc;
}

double AxisLimiter::jerkLimit(const Vector3d& direction) const {
    double jerk = UNLIMITED;
    for (int a = 0; a < NUM_AXES; ++a) {
        double component = std::abs(direction[a]);
        if (component < AXIS_EPSILON || !(limits_[a].maxJerk > 0)) continue;
        jerk = std::min(jerk, limits_[a].maxJerk / component);
    }
    return jerk;
}

SegmentLimits AxisLimiter::limitsFor(const Segment& segment) const {
    SegmentLimits result;

    if (segment.isLine()) {
        Vector3d d = segment.startTangent();
        result.vMax = velocityLimit(d);
        result.aMax = accelerationLimit(d);
        if (jerkLimited_) {
            result.jMax = jerkLimit(d);
        }
        return result;
    }

    // Arc: worst-case projections over the swept range
    double vDirection = UNLIMITED;
    double aEffective = UNLIMITED;
    double jEffective = UNLIMITED;
    for (int a = 0; a < NUM_AXES; ++a) {
        double tangent = segment.maxTangentComponent(a);
        if (tangent >= AXIS_EPSILON) {
            vDirection = std::min(vDirection, limits_[a].maxVelocity / tangent);
        }
        double extent = segment.axisExtent(a);
        if (extent >= AXIS_EPSILON) {
            aEffective = std::min(aEffective, limits_[a].maxAcceleration / extent);
            if (limits_[a].maxJerk > 0) {
                jEffective = std::min(jEffective, limits_[a].maxJerk / extent);
            }
        }
    }

    double aShare = aEffective * ARC_ACCEL_SHARE;
    double curvature = segment.curvature();
    double vCentripetal = (curvature > EPSILON) ? std::sqrt(aShare / curvature) : UNLIMITED;

    result.vMax = std::min(vDirection, vCentripetal);
    result.aMax = aShare;
    if (jerkLimited_) {
        result.jMax = jEffective * ARC_ACCEL_SHARE;
    }
    return result;
}

bool AxisLimiter::withinLimits(const Vector3d& axisVelocity,
                               const Vector3d& axisAcceleration,
                               double tolerance) const {
    for (int a = 0; a < NUM_AXES; ++a) {
        double vBound = limits_[a].maxVelocity * (1.0 + tolerance) + 1e-9;
        double aBound = limits_[a].maxAcceleration * (1.0 + tolerance) + 1e-9;
        if (std::abs(axisVelocity[a]) > vBound) return false;
        if (std::abs(axisAcceleration[a]) > aBound) return false;
    }
    return true;
}

} // namespace trajectory
} // namespace motion_planner
