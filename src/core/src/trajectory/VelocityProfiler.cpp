/**
 * @file VelocityProfiler.cpp
 * @brief Implementation of the forward/backward look-ahead passes
 */

#include "VelocityProfiler.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace motion_planner {
namespace trajectory {

double VelocityProfiler::reachableVelocity(double v, double distance, double acceleration) {
    if (distance <= 0 || acceleration <= 0) return v;
    return std::sqrt(v * v + 2.0 * acceleration * distance);
}

double VelocityProfiler::reachableVelocity(double v, double distance,
                                           const SegmentLimits& limits) {
    return KinematicProfile::reachableVelocity(v, distance, limits.aMax, limits.jMax);
}

// ============================================================================
// Pass 1: Forward
// ============================================================================

void VelocityProfiler::forwardPass(std::vector<WindowEntry>& entries,
                                   double vEntry, double vExit) const {
    int N = static_cast<int>(entries.size());

    for (int i = 0; i < N; ++i) {
        auto& e = entries[i];

        if (i == 0) {
            e.vEntry = vEntry;
        } else {
            e.vEntry = std::min({entries[i - 1].vExit, e.junctionLimit, e.limits.vMax});
            entries[i - 1].vExit = e.vEntry;
        }

        double next = (i + 1 < N) ? entries[i + 1].junctionLimit : vExit;
        double reachable = reachableVelocity(e.vEntry, e.length, e.limits);

        e.vExit = std::min({reachable, e.limits.vMax, next});
        e.state = PlanState::FORWARD_ESTIMATED;
    }
}

// ============================================================================
// Pass 2: Backward
// ============================================================================

bool VelocityProfiler::backwardPass(std::vector<WindowEntry>& entries, double vExit) const {
    int N = static_cast<int>(entries.size());
    if (N == 0) return true;

    bool feasible = true;
    entries[N - 1].vExit = std::min(entries[N - 1].vExit, vExit);

    for (int i = N - 1; i >= 0; --i) {
        auto& e = entries[i];
        double maxEntry = reachableVelocity(e.vExit, e.length, e.limits);

        if (e.vEntry > maxEntry) {
            if (i == 0) {
                feasible = false;
            } else {
                e.vEntry = maxEntry;
                entries[i - 1].vExit = maxEntry;
            }
        }
        e.state = PlanState::BACKWARD_CORRECTED;
    }

    return feasible;
}

void VelocityProfiler::enforceBrakingFloor(std::vector<WindowEntry>& entries) const {
    int N = static_cast<int>(entries.size());

    for (int i = 0; i < N; ++i) {
        auto& e = entries[i];
        double minExit = KinematicProfile::brakingVelocity(e.vEntry, e.vExit, e.length,
                                                           e.limits.aMax, e.limits.jMax);

        if (e.vExit < minExit) {
            LOG_WARN("Junction {} raised from {:.3f} to {:.3f} mm/s: committed entry cannot brake in time",
                     i + 1, e.vExit, minExit);
            e.vExit = minExit;
            if (i + 1 < N) {
                entries[i + 1].vEntry = std::max(entries[i + 1].vEntry, minExit);
            }
        }
    }
}

bool VelocityProfiler::plan(std::vector<WindowEntry>& entries,
                            double vEntry, double vExit) const {
    if (entries.empty()) return true;

    forwardPass(entries, vEntry, vExit);
    if (backwardPass(entries, vExit)) {
        return true;
    }

    enforceBrakingFloor(entries);
    return false;
}

// ============================================================================
// Pass 3: Synthesis
// ============================================================================

KinematicProfile VelocityProfiler::synthesize(const WindowEntry& entry) const {
    return KinematicProfile::synthesize(entry.length, entry.vEntry, entry.vExit, entry.limits);
}

} // namespace trajectory
} // namespace motion_planner
