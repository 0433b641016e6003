/**
 * @file KinematicProfile.cpp
 * @brief Trapezoidal / triangular / S-curve profile synthesis and sampling
 */

#include "KinematicProfile.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>

namespace motion_planner {
namespace trajectory {

namespace {

// Phases shorter than this are dropped
constexpr double MIN_PHASE_DURATION = 1e-12;

constexpr int BISECTION_ITERATIONS = 100;

bool hasJerkBound(double jMax) {
    return std::isfinite(jMax) && jMax > 0;
}

// Duration of a jerk-limited velocity change that starts and ends at zero acceleration
double rampDuration(double dv, double aMax, double jMax) {
    dv = std::abs(dv);
    if (dv * jMax < aMax * aMax) {
        // a_max not reached: jerk+ then jerk-
        return 2.0 * std::sqrt(dv / jMax);
    }
    return dv / aMax + aMax / jMax;
}

} // namespace

// ============================================================================
// Ramp Kinematics
// ============================================================================

double KinematicProfile::rampDistance(double v0, double v1, double aMax, double jMax) {
    if (!(aMax > 0)) return UNLIMITED;
    if (!hasJerkBound(jMax)) {
        return std::abs(v1 * v1 - v0 * v0) / (2.0 * aMax);
    }
    return 0.5 * (v0 + v1) * rampDuration(v1 - v0, aMax, jMax);
}

double KinematicProfile::reachableVelocity(double v, double distance,
                                           double aMax, double jMax) {
    if (distance <= 0 || aMax <= 0) return v;

    // Constant acceleration bounds every jerk-limited ramp from above
    double upper = std::sqrt(v * v + 2.0 * aMax * distance);
    if (!hasJerkBound(jMax)) return upper;

    // Ramp distance grows with the target velocity
    double lo = v;
    double hi = upper;
    for (int i = 0; i < BISECTION_ITERATIONS; ++i) {
        double mid = 0.5 * (lo + hi);
        if (rampDistance(v, mid, aMax, jMax) <= distance) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

double KinematicProfile::brakingVelocity(double v, double floor, double distance,
                                         double aMax, double jMax) {
    floor = std::clamp(floor, 0.0, v);
    if (rampDistance(floor, v, aMax, jMax) <= distance) return floor;
    if (!hasJerkBound(jMax)) {
        return std::sqrt(std::max(v * v - 2.0 * aMax * distance, 0.0));
    }

    // Jerk-limited braking distance is not monotonic in the exit velocity,
    // but above an infeasible floor the feasible exits form one interval
    double lo = floor;
    double hi = v;
    for (int i = 0; i < BISECTION_ITERATIONS; ++i) {
        double mid = 0.5 * (lo + hi);
        if (rampDistance(mid, v, aMax, jMax) <= distance) {
            hi = mid;
        } else {
            lo = mid;
        }
    }
    return hi;
}

// ============================================================================
// Construction
// ============================================================================

void KinematicProfile::addPhase(PhaseType type, double vStart, double vEnd,
                                double acceleration, double duration, double jerk) {
    if (!(duration > MIN_PHASE_DURATION)) {
        return;
    }
    phases_.push_back({type, vStart, vEnd, acceleration, duration, jerk});
    duration_ += duration;
    peakVelocity_ = std::max({peakVelocity_, vStart, vEnd});
}

void KinematicProfile::addRamp(double vFrom, double vTo, double aMax, double jMax) {
    // Even tiny changes take 2·sqrt(|Δv|/j) and cover distance
    double dv = vTo - vFrom;
    if (dv == 0) {
        return;
    }

    PhaseType type = dv > 0 ? PhaseType::ACCELERATE : PhaseType::DECELERATE;
    double sign = dv > 0 ? 1.0 : -1.0;
    double magnitude = std::abs(dv);

    double tJerk;
    double tConstant;
    double aPeak;
    if (magnitude * jMax < aMax * aMax) {
        tJerk = std::sqrt(magnitude / jMax);
        tConstant = 0;
        aPeak = jMax * tJerk;
    } else {
        tJerk = aMax / jMax;
        tConstant = magnitude / aMax - aMax / jMax;
        aPeak = aMax;
    }

    double j = sign * jMax;
    double a = sign * aPeak;

    double v1 = vFrom + 0.5 * j * tJerk * tJerk;
    double v2 = v1 + a * tConstant;

    addPhase(type, vFrom, v1, 0.0, tJerk, j);
    addPhase(type, v1, v2, a, tConstant);
    addPhase(type, v2, vTo, a, tJerk, -j);
}

void KinematicProfile::finish(double length) {
    length_ = length;
    assert(std::abs(integratedDistance() - length_) <= 1e-6 * std::max(1.0, length_));
}

KinematicProfile KinematicProfile::synthesize(double length, double v0, double v1,
                                              double vMax, double aMax) {
    KinematicProfile profile;
    if (!(length > 0) || !(vMax > 0) || !(aMax > 0)) {
        return profile;
    }

    v0 = std::clamp(v0, 0.0, vMax);
    v1 = std::clamp(v1, 0.0, vMax);

    // Exit cannot exceed what full acceleration reaches over L
    v1 = std::min(v1, std::sqrt(v0 * v0 + 2.0 * aMax * length));

    profile.entryVelocity_ = v0;
    profile.exitVelocity_ = v1;
    profile.peakVelocity_ = std::max(v0, v1);

    // Entry too fast to brake within L: the planner's backward pass
    // guarantees this only happens through rounding
    double vEntryBound = std::sqrt(v1 * v1 + 2.0 * aMax * length);
    if (v0 > vEntryBound) {
        double required = (v0 * v0 - v1 * v1) / (2.0 * length);
        assert(required <= aMax * (1.0 + 1e-6));
        profile.addPhase(PhaseType::DECELERATE, v0, v1, -required, (v0 - v1) / required);
        profile.finish(length);
        return profile;
    }

    double vPeakSq = (2.0 * aMax * length + v0 * v0 + v1 * v1) / 2.0;

    if (vPeakSq >= vMax * vMax) {
        // Trapezoid: reach vMax, cruise, decelerate
        double dAccel = (vMax * vMax - v0 * v0) / (2.0 * aMax);
        double dDecel = (vMax * vMax - v1 * v1) / (2.0 * aMax);
        double dCruise = std::max(0.0, length - dAccel - dDecel);

        profile.addPhase(PhaseType::ACCELERATE, v0, vMax, aMax, (vMax - v0) / aMax);
        profile.addPhase(PhaseType::CRUISE, vMax, vMax, 0.0, dCruise / vMax);
        profile.addPhase(PhaseType::DECELERATE, vMax, v1, -aMax, (vMax - v1) / aMax);
    }
    else {
        // Triangle: no cruise
        double vPeak = std::max({std::sqrt(vPeakSq), v0, v1});

        profile.addPhase(PhaseType::ACCELERATE, v0, vPeak, aMax, (vPeak - v0) / aMax);
        profile.addPhase(PhaseType::DECELERATE, vPeak, v1, -aMax, (vPeak - v1) / aMax);
    }

    profile.finish(length);
    assert(profile.peakVelocity_ <= vMax * (1.0 + 1e-9));
    return profile;
}

KinematicProfile KinematicProfile::synthesizeSCurve(double length, double v0, double v1,
                                                    double vMax, double aMax, double jMax) {
    if (!hasJerkBound(jMax)) {
        return synthesize(length, v0, v1, vMax, aMax);
    }

    KinematicProfile profile;
    if (!(length > 0) || !(vMax > 0) || !(aMax > 0)) {
        return profile;
    }

    v0 = std::clamp(v0, 0.0, vMax);
    v1 = std::clamp(v1, 0.0, vMax);
    v1 = std::min(v1, reachableVelocity(v0, length, aMax, jMax));

    // Boundary velocities too far apart for a jerk-limited ramp over L
    if (rampDistance(v0, v1, aMax, jMax) > length * (1.0 + 1e-9)) {
        return synthesize(length, v0, v1, vMax, aMax);
    }

    auto travel = [&](double vPeak) {
        return rampDistance(v0, vPeak, aMax, jMax) + rampDistance(vPeak, v1, aMax, jMax);
    };

    // Peak velocity: vMax when it fits, otherwise the highest one that does
    double vPeak = vMax;
    if (travel(vMax) > length) {
        double lo = std::max(v0, v1);
        double hi = vMax;
        for (int i = 0; i < BISECTION_ITERATIONS; ++i) {
            double mid = 0.5 * (lo + hi);
            if (travel(mid) <= length) {
                lo = mid;
            } else {
                hi = mid;
            }
        }
        vPeak = lo;
    }

    // Cruise also absorbs the bisection residual
    double cruise = std::max(0.0, length - travel(vPeak));

    profile.entryVelocity_ = v0;
    profile.exitVelocity_ = v1;
    profile.peakVelocity_ = std::max(v0, v1);

    profile.addRamp(v0, vPeak, aMax, jMax);
    if (vPeak > EPSILON) {
        profile.addPhase(PhaseType::CRUISE, vPeak, vPeak, 0.0, cruise / vPeak);
    }
    profile.addRamp(vPeak, v1, aMax, jMax);

    profile.finish(length);
    assert(profile.peakVelocity_ <= vMax * (1.0 + 1e-9));
    return profile;
}

KinematicProfile KinematicProfile::synthesize(double length, double v0, double v1,
                                              const SegmentLimits& limits) {
    if (limits.jerkLimited()) {
        return synthesizeSCurve(length, v0, v1, limits.vMax, limits.aMax, limits.jMax);
    }
    return synthesize(length, v0, v1, limits.vMax, limits.aMax);
}

KinematicProfile KinematicProfile::decelerateToStop(double v0, double deceleration) {
    KinematicProfile profile;
    if (!(v0 > 0) || !(deceleration > 0)) {
        return profile;
    }

    profile.entryVelocity_ = v0;
    profile.exitVelocity_ = 0;
    profile.peakVelocity_ = v0;
    profile.addPhase(PhaseType::DECELERATE, v0, 0.0, -deceleration, v0 / deceleration);
    profile.finish(v0 * v0 / (2.0 * deceleration));
    return profile;
}

// ============================================================================
// Sampling
// ============================================================================

ProfileSample KinematicProfile::evaluate(double t) const {
    ProfileSample sample;

    if (phases_.empty() || t <= 0) {
        sample.position = 0;
        sample.velocity = entryVelocity_;
        sample.acceleration = phases_.empty() ? 0.0 : phases_.front().acceleration;
        return sample;
    }

    if (t >= duration_) {
        sample.position = length_;
        sample.velocity = exitVelocity_;
        sample.acceleration = 0;
        return sample;
    }

    double phaseStart = 0;
    double distance = 0;
    bool found = false;
    for (const auto& phase : phases_) {
        if (t < phaseStart + phase.duration) {
            double tau = t - phaseStart;
            double a0 = phase.acceleration;
            double j = phase.jerk;
            sample.acceleration = a0 + j * tau;
            sample.velocity = phase.vStart + a0 * tau + 0.5 * j * tau * tau;
            sample.position = distance + phase.vStart * tau + 0.5 * a0 * tau * tau +
                              j * tau * tau * tau / 6.0;
            found = true;
            break;
        }
        phaseStart += phase.duration;
        distance += phase.distance();
    }

    // Rounding between duration_ and the phase sum
    if (!found) {
        sample.position = length_;
        sample.velocity = exitVelocity_;
        sample.acceleration = 0;
        return sample;
    }

    sample.velocity = std::max(sample.velocity, 0.0);
    sample.position = std::clamp(sample.position, 0.0, length_);
    return sample;
}

bool KinematicProfile::hasCruise() const {
    return std::any_of(phases_.begin(), phases_.end(),
                       [](const ProfilePhase& p) { return p.type == PhaseType::CRUISE; });
}

bool KinematicProfile::isJerkLimited() const {
    return std::any_of(phases_.begin(), phases_.end(),
                       [](const ProfilePhase& p) { return p.jerk != 0; });
}

double KinematicProfile::integratedDistance() const {
    double total = 0;
    for (const auto& phase : phases_) {
        total += phase.distance();
    }
    return total;
}

} // namespace trajectory
} // namespace motion_planner
