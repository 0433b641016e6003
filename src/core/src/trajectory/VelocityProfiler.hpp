/**
 * @file VelocityProfiler.hpp
 * @brief Two-pass velocity look-ahead over the planning window
 *
 * Assigns entry/exit velocities to each segment of the lookahead window
 * so the tool keeps speed through permissive junctions and can always
 * stop by the end of the window.
 *
 * Algorithm:
 *   1. Forward pass: entry(i) = min(exit(i-1), J(i), v_max(i)); assume
 *      maximum acceleration over the segment to estimate exit(i).
 *   2. Backward pass: walking in reverse, reduce entry(i) (and exit(i-1))
 *      wherever braking from exit(i) within L(i) is impossible.
 *   3. Synthesis: trapezoidal / triangular profile per segment, or the
 *      jerk-limited S-curve when the segment limits carry a jerk bound.
 *
 * With a jerk bound, reachability uses the jerk-limited ramp distance
 * instead of v² = v0² + 2·a·L, so every corrected pair of boundary
 * velocities can be joined by an S-curve.
 *
 * The entry velocity of the first segment is fixed: it is the exit of a
 * profile that was already finalized.
 *
 * References:
 *   - Biagiotti, L.; Melchiorri, C. "Trajectory Planning for Automatic
 *     Machines and Robots." Springer 2008.
 */

#pragma once

#include "KinematicProfile.hpp"
#include "PlannerTypes.hpp"
#include <vector>

namespace motion_planner {
namespace trajectory {

// ============================================================================
// Window Entry (input/output of the passes)
// ============================================================================

struct WindowEntry {
    double length = 0;             // Segment arc length (mm)
    SegmentLimits limits;          // From AxisLimiter
    double junctionLimit = 0;      // JunctionVelocity at the segment entry (mm/s)

    // Filled by the passes
    double vEntry = 0;
    double vExit = 0;
    PlanState state = PlanState::PENDING;
};

// ============================================================================
// Velocity Profiler
// ============================================================================

class VelocityProfiler {
public:
    VelocityProfiler() = default;

    /**
     * Run forward and backward passes.
     *
     * @param entries  Window entries (modified in place)
     * @param vEntry   Fixed entry velocity of the first segment
     * @param vExit    Required exit velocity of the last segment
     * @return false if the fixed entry velocity could not be honoured and
     *         downstream junctions had to be raised
     */
    bool plan(std::vector<WindowEntry>& entries, double vEntry, double vExit) const;

    void forwardPass(std::vector<WindowEntry>& entries, double vEntry, double vExit) const;

    /**
     * @return false if the first segment's entry needed reduction
     */
    bool backwardPass(std::vector<WindowEntry>& entries, double vExit) const;

    /**
     * Profile of one corrected entry
     */
    KinematicProfile synthesize(const WindowEntry& entry) const;

    /**
     * Highest velocity reachable from v over a distance at constant acceleration
     */
    static double reachableVelocity(double v, double distance, double acceleration);

    /**
     * Highest velocity reachable from v over a distance under segment limits
     */
    static double reachableVelocity(double v, double distance, const SegmentLimits& limits);

private:
    // Raise junctions to the slowest braking envelope from the fixed entry
    void enforceBrakingFloor(std::vector<WindowEntry>& entries) const;
};

} // namespace trajectory
} // namespace motion_planner
