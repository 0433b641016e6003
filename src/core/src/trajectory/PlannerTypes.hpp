/**
 * @file PlannerTypes.hpp
 * @brief Shared types for segment planning: limits, tolerance policy, errors
 */

#pragma once

#include "../geometry/MathTypes.hpp"
#include <cmath>
#include <cstddef>
#include <map>
#include <string>

namespace motion_planner {
namespace trajectory {

using namespace geometry;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * Cartesian axis identifier
 */
enum class Axis {
    X = 0,
    Y = 1,
    Z = 2
};

/**
 * Corner tolerance policy
 */
enum class ToleranceType {
    EXACT_STOP,   // Stop at every vertex
    EXACT_PATH,   // Stop unless segments are tangent-continuous
    BLEND         // Round corners within a maximum deviation
};

/**
 * Velocity profile shape synthesized per segment
 */
enum class ProfileType {
    TRAPEZOIDAL,   // Piecewise constant acceleration
    S_CURVE        // Jerk-limited, 7 phases
};

/**
 * Planning state of a segment inside the lookahead window
 */
enum class PlanState {
    PENDING,
    FORWARD_ESTIMATED,
    BACKWARD_CORRECTED,
    FINALIZED,
    SUPERSEDED    // Replaced by a stop profile (cancel / underrun)
};

/**
 * Planner error codes
 */
enum class PlannerError {
    NONE = 0,
    INVALID_GEOMETRY,    // Zero-length segment, bad radius or plane normal
    QUEUE_FULL,          // Ring buffer at capacity
    INFEASIBLE_LIMITS,   // Empty or non-positive axis limits
    NOT_CONFIGURED       // Planning requested without a valid context
};

inline const char* plannerErrorToString(PlannerError error) {
    switch (error) {
        case PlannerError::NONE:              return "none";
        case PlannerError::INVALID_GEOMETRY:  return "invalid geometry";
        case PlannerError::QUEUE_FULL:        return "queue full";
        case PlannerError::INFEASIBLE_LIMITS: return "infeasible limits";
        case PlannerError::NOT_CONFIGURED:    return "not configured";
    }
    return "unknown";
}

inline const char* profileTypeToString(ProfileType type) {
    switch (type) {
        case ProfileType::TRAPEZOIDAL: return "trapezoidal";
        case ProfileType::S_CURVE:     return "s_curve";
    }
    return "unknown";
}

inline const char* axisToString(Axis axis) {
    switch (axis) {
        case Axis::X: return "X";
        case Axis::Y: return "Y";
        case Axis::Z: return "Z";
    }
    return "?";
}

// ============================================================================
// Limits and Policy
// ============================================================================

/**
 * Kinematic limits of a single axis. maxJerk is only read by S_CURVE planning.
 */
struct AxisLimit {
    double maxVelocity = 0;       // mm/s
    double maxAcceleration = 0;   // mm/s²
    double maxJerk = 0;           // mm/s³
};

using AxisLimits = std::map<Axis, AxisLimit>;

/**
 * Corner tolerance mode. maxDeviation is only used by BLEND.
 */
struct ToleranceMode {
    ToleranceType type = ToleranceType::EXACT_STOP;
    double maxDeviation = 0;      // mm

    static ToleranceMode exactStop() { return {ToleranceType::EXACT_STOP, 0}; }
    static ToleranceMode exactPath() { return {ToleranceType::EXACT_PATH, 0}; }
    static ToleranceMode blend(double deviation) { return {ToleranceType::BLEND, deviation}; }
};

/**
 * Effective path-space bounds of one segment, as derived by AxisLimiter
 */
struct SegmentLimits {
    double vMax = 0;          // Max path velocity (mm/s)
    double aMax = 0;          // Max tangential acceleration (mm/s²)
    double jMax = UNLIMITED;  // Max tangential jerk (mm/s³), UNLIMITED for trapezoids

    bool jerkLimited() const { return std::isfinite(jMax) && jMax > 0; }
};

/**
 * Everything a planning run reads. Passed explicitly into each run and
 * never mutated while a run is in progress.
 */
struct PlanningContext {
    AxisLimits axisLimits;
    ToleranceMode tolerance;
    ProfileType profile = ProfileType::TRAPEZOIDAL;
    double colinearTolerance = 1e-6;   // rad
    size_t lookahead = 16;

    /**
     * Check that the context can drive a planning run.
     * @param error Filled with a description when invalid
     */
    bool validate(std::string& error) const;
};

// ============================================================================
// Results
// ============================================================================

/**
 * Result of pushing a segment into the queue
 */
struct PushResult {
    bool success = false;
    PlannerError error = PlannerError::NONE;
    std::string message;
};

} // namespace trajectory
} // namespace motion_planner
