/**
 * @file MotionEmitter.hpp
 * @brief Fixed-rate sampling of finalized profiles into axis setpoints
 *
 * Each tick advances time by the control period, locates the active
 * phase of the current move and integrates its constant acceleration.
 * Path velocity is mapped to axis velocity through the tangent at the
 * current arc-length progress (re-evaluated every sample on arcs), and
 * centripetal acceleration v²·κ is added along the curvature normal.
 *
 * Safety behaviour:
 *   - Underrun: when no successor move is buffered and the active move
 *     ends in motion, the move is superseded by a stop that ends on the
 *     segment, and the event is logged. A move that still finishes in
 *     motion is followed by a stop that continues along its end tangent.
 *   - cancel(): the active move (and as many buffered moves as braking
 *     needs) is superseded by a decelerate-to-zero profile at the
 *     segment's acceleration limit, starting from the current velocity.
 *   - A move whose planned entry velocity differs from the actual one is
 *     re-synthesized from the actual velocity before it starts.
 *
 * tick() never waits for the planner: enqueue() and tick() share one
 * short critical section.
 */

#pragma once

#include "AxisLimiter.hpp"
#include "MotionPlanner.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace motion_planner {
namespace trajectory {

enum class EmitterState {
    IDLE,       // Holding position, nothing to execute
    RUNNING,    // Executing planned moves
    STOPPING    // Executing a superseding stop (cancel / underrun)
};

/**
 * Per-tick output for the device / IK layer
 */
struct AxisSetpoint {
    double time = 0;                                  // s since emitter start
    Vector3d position = Vector3d::Zero();             // mm
    Vector3d velocity = Vector3d::Zero();             // mm/s
    Vector3d acceleration = Vector3d::Zero();         // mm/s²
    double pathVelocity = 0;                          // mm/s
    uint64_t segmentId = 0;
    bool moving = false;                              // false while holding
};

class MotionEmitter {
public:
    MotionEmitter(const AxisLimits& limits, double tickPeriod);

    // Non-copyable (mutex, atomics)
    MotionEmitter(const MotionEmitter&) = delete;
    MotionEmitter& operator=(const MotionEmitter&) = delete;

    /**
     * Position held while idle (initial tool position)
     */
    void setPosition(const Vector3d& position);

    void enqueue(PlannedMove move);
    void enqueue(std::vector<PlannedMove> moves);

    /**
     * Produce the setpoint for the next control period
     */
    AxisSetpoint tick();

    /**
     * Request a controlled stop. Applied at the next tick.
     */
    void cancel();

    EmitterState getState() const;
    bool isIdle() const;

    /**
     * Execution time left in the active and buffered moves (s)
     */
    double bufferedTime() const;
    size_t bufferedMoves() const;

    double tickPeriod() const { return tickPeriod_; }
    double pathVelocity() const;
    size_t underrunCount() const;

private:
    bool activateNext();
    void completeActive();
    void handleCancel();
    void checkUnderrun(const ProfileSample& sample);

    // Decelerate-to-zero from the end of a move that finished in motion
    PlannedMove stopBeyond(const PlannedMove& finished, double velocity) const;
    AxisSetpoint sampleActive();
    AxisSetpoint holdSetpoint() const;

    /**
     * Geometry at absolute arc length s. Beyond the segment end the path
     * continues along the end tangent.
     */
    void pathState(const Segment& segment, double s,
                   Vector3d& position, Vector3d& tangent,
                   Vector3d& normal, double& curvature) const;

    AxisLimiter limiter_;
    double tickPeriod_;
    double time_ = 0;

    mutable std::mutex mutex_;
    std::deque<PlannedMove> buffer_;
    std::optional<PlannedMove> active_;
    double localTime_ = 0;
    double lastProgress_ = 0;       // Profile position at the last sample
    double pathVelocity_ = 0;
    Vector3d holdPosition_ = Vector3d::Zero();
    EmitterState state_ = EmitterState::IDLE;
    size_t underrunCount_ = 0;

    std::atomic<bool> cancelRequested_{false};
};

} // namespace trajectory
} // namespace motion_planner
