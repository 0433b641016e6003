/**
 * @file KinematicProfile.hpp
 * @brief Velocity profile over one segment: trapezoidal or jerk-limited S-curve
 *
 * Trapezoidal phases:
 * 1. Acceleration (constant accel)
 * 2. Cruise (constant velocity)
 * 3. Deceleration (constant decel)
 *
 * Any phase may be absent. When the segment is too short to reach v_max
 * the cruise phase is dropped and the peak velocity is
 *
 *   v_p = sqrt((2·a·L + v0² + v1²) / 2)
 *
 * (triangular profile).
 *
 * S-curve (double S, Biagiotti & Melchiorri ch. 3.4) splits each velocity
 * ramp into jerk+ / constant acceleration / jerk- phases, so acceleration
 * starts and ends every ramp at zero:
 *
 *   T1..T3: ramp v0 -> v_p,  T4: cruise,  T5..T7: ramp v_p -> v1
 *
 * A ramp of |Δv| takes 2·sqrt(|Δv|/j) when a_max is not reached, otherwise
 * |Δv|/a + a/j, and covers (v_from + v_to)/2 times that duration.
 *
 * Integrating velocity over all phases reproduces the segment length L.
 */

#pragma once

#include "PlannerTypes.hpp"
#include <vector>

namespace motion_planner {
namespace trajectory {

enum class PhaseType {
    ACCELERATE,
    CRUISE,
    DECELERATE
};

struct ProfilePhase {
    PhaseType type;
    double vStart;          // mm/s
    double vEnd;            // mm/s
    double acceleration;    // mm/s², signed, at phase start
    double duration;        // s
    double jerk = 0;        // mm/s³, signed (0 for trapezoidal phases)

    double distance() const {
        return vStart * duration + 0.5 * acceleration * duration * duration +
               jerk * duration * duration * duration / 6.0;
    }
};

/**
 * Path-space state at a point in time
 */
struct ProfileSample {
    double position = 0;      // Arc length from segment start (mm)
    double velocity = 0;      // mm/s
    double acceleration = 0;  // mm/s²
};

class KinematicProfile {
public:
    KinematicProfile() = default;

    /**
     * Build the fastest trapezoidal profile over a segment.
     *
     * @param length  Segment arc length L (> 0)
     * @param v0      Entry velocity
     * @param v1      Exit velocity
     * @param vMax    Velocity limit (> 0)
     * @param aMax    Acceleration limit (> 0)
     */
    static KinematicProfile synthesize(double length, double v0, double v1,
                                       double vMax, double aMax);

    /**
     * Build the fastest jerk-limited profile over a segment. Falls back to
     * the trapezoidal profile when the boundary velocities cannot be joined
     * within L under the jerk bound.
     */
    static KinematicProfile synthesizeSCurve(double length, double v0, double v1,
                                             double vMax, double aMax, double jMax);

    /**
     * Trapezoidal or S-curve depending on whether the limits carry a jerk bound
     */
    static KinematicProfile synthesize(double length, double v0, double v1,
                                       const SegmentLimits& limits);

    /**
     * Single deceleration phase from v0 to standstill
     */
    static KinematicProfile decelerateToStop(double v0, double deceleration);

    /**
     * Distance needed to change velocity from v0 to v1 (either direction).
     * jMax = UNLIMITED gives the constant-acceleration distance.
     */
    static double rampDistance(double v0, double v1, double aMax, double jMax);

    /**
     * Highest velocity reachable from v within a distance. Also the highest
     * entry velocity from which v can still be reached (ramps are symmetric).
     */
    static double reachableVelocity(double v, double distance, double aMax, double jMax);

    /**
     * Lowest velocity >= floor that braking from v reaches within a distance
     */
    static double brakingVelocity(double v, double floor, double distance,
                                  double aMax, double jMax);

    /**
     * Evaluate at time t since profile start (clamped to [0, duration])
     */
    ProfileSample evaluate(double t) const;

    const std::vector<ProfilePhase>& phases() const { return phases_; }

    double duration() const { return duration_; }
    double length() const { return length_; }
    double entryVelocity() const { return entryVelocity_; }
    double exitVelocity() const { return exitVelocity_; }
    double peakVelocity() const { return peakVelocity_; }

    bool hasCruise() const;
    bool isTriangular() const { return !phases_.empty() && !hasCruise(); }
    bool isJerkLimited() const;

    /**
     * Sum of phase distances
     */
    double integratedDistance() const;

private:
    void addPhase(PhaseType type, double vStart, double vEnd,
                  double acceleration, double duration, double jerk = 0);

    // Jerk-limited velocity change from vFrom to vTo
    void addRamp(double vFrom, double vTo, double aMax, double jMax);

    void finish(double length);

    std::vector<ProfilePhase> phases_;
    double duration_ = 0;
    double length_ = 0;
    double entryVelocity_ = 0;
    double exitVelocity_ = 0;
    double peakVelocity_ = 0;
};

} // namespace trajectory
} // namespace motion_planner
