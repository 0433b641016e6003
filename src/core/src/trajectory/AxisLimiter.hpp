/**
 * @file AxisLimiter.hpp
 * @brief Projection of per-axis limits onto a segment's path direction
 *
 * The path speed of a move is capped by whichever axis saturates first:
 *
 *   v_limit = min over axes a of  v_max[a] / |d_a|
 *   a_limit = min over axes a of  a_max[a] / |d_a|
 *
 * Axes with |d_a| ≈ 0 are not in motion and do not constrain the move.
 *
 * Arcs: the tangent rotates, so |d_a| is the largest tangent component
 * over the swept range. Tangential and centripetal acceleration share the
 * projected bound: each gets a_eff/√2, so their vector sum never exceeds
 * a_eff. This yields the centripetal speed cap v <= sqrt(a_eff/√2 · r).
 *
 * When jerk limiting is enabled the tangential jerk bound is projected the
 * same way as acceleration (j_max[a] / |d_a|, or the axis extent on arcs).
 */

#pragma once

#include "PlannerTypes.hpp"
#include "Segment.hpp"
#include <array>

namespace motion_planner {
namespace trajectory {

class AxisLimiter {
public:
    // Fraction of the projected acceleration given to each of the
    // tangential and centripetal components on arcs (1/√2)
    static constexpr double ARC_ACCEL_SHARE = 0.70710678118654752440;

    AxisLimiter() = default;
    explicit AxisLimiter(const AxisLimits& limits, bool jerkLimited = false);

    /**
     * Effective path-space bounds for a segment
     */
    SegmentLimits limitsFor(const Segment& segment) const;

    /**
     * Path velocity limit for motion along a unit direction
     */
    double velocityLimit(const Vector3d& direction) const;

    /**
     * Path acceleration limit for acceleration along a unit direction
     */
    double accelerationLimit(const Vector3d& direction) const;

    /**
     * Path jerk limit for motion along a unit direction
     */
    double jerkLimit(const Vector3d& direction) const;

    /**
     * Check per-axis velocity and acceleration against the configured limits.
     * @param tolerance Relative slack for floating-point error
     */
    bool withinLimits(const Vector3d& axisVelocity,
                      const Vector3d& axisAcceleration,
                      double tolerance = 1e-6) const;

private:
    std::array<AxisLimit, NUM_AXES> limits_{};
    bool jerkLimited_ = false;
};

} // namespace trajectory
} // namespace motion_planner
