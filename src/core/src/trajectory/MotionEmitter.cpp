/**
 * @file MotionEmitter.cpp
 * @brief Real-time setpoint generation from finalized moves
 */

#include "MotionEmitter.hpp"
#include "VelocityProfiler.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>

namespace motion_planner {
namespace trajectory {

namespace {

// Velocities below this are standstill (mm/s)
constexpr double VELOCITY_EPSILON = 1e-6;

// Allowed gap between consecutive segments before warning (mm)
constexpr double CONTINUITY_TOLERANCE = 1e-3;

} // namespace

MotionEmitter::MotionEmitter(const AxisLimits& limits, double tickPeriod)
    : limiter_(limits),
      tickPeriod_(tickPeriod > 0 ? tickPeriod : 0.001) {
}

void MotionEmitter::setPosition(const Vector3d& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    holdPosition_ = position;
}

void MotionEmitter::enqueue(PlannedMove move) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(std::move(move));
}

void MotionEmitter::enqueue(std::vector<PlannedMove> moves) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& move : moves) {
        buffer_.push_back(std::move(move));
    }
}

void MotionEmitter::cancel() {
    cancelRequested_.store(true);
}

EmitterState MotionEmitter::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool MotionEmitter::isIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !active_ && buffer_.empty();
}

double MotionEmitter::bufferedTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = active_ ? std::max(active_->profile.duration() - localTime_, 0.0) : 0.0;
    for (const auto& move : buffer_) {
        total += move.profile.duration();
    }
    return total;
}

size_t MotionEmitter::bufferedMoves() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

double MotionEmitter::pathVelocity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pathVelocity_;
}

size_t MotionEmitter::underrunCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return underrunCount_;
}

// ============================================================================
// Tick
// ============================================================================

AxisSetpoint MotionEmitter::tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    time_ += tickPeriod_;

    if (cancelRequested_.exchange(false)) {
        handleCancel();
    }

    if (!active_) {
        if (!activateNext()) {
            state_ = EmitterState::IDLE;
            return holdSetpoint();
        }
        localTime_ = 0;
    }

    localTime_ += tickPeriod_;

    // Carry leftover time into the following moves, never skip a tick
    while (localTime_ >= active_->profile.duration()) {
        double overflow = localTime_ - active_->profile.duration();
        double exitVelocity = active_->profile.exitVelocity();
        PlannedMove finished = *active_;
        completeActive();

        if (!activateNext()) {
            if (exitVelocity <= VELOCITY_EPSILON) {
                state_ = EmitterState::IDLE;
                return holdSetpoint();
            }
            ++underrunCount_;
            LOG_ERROR("Planner underrun after segment #{} at {:.3f} mm/s, stopping past its end",
                      finished.id, exitVelocity);
            active_ = stopBeyond(finished, exitVelocity);
            state_ = EmitterState::STOPPING;
        }
        localTime_ = overflow;
    }

    AxisSetpoint setpoint = sampleActive();
    checkUnderrun(active_->profile.evaluate(localTime_));
    return setpoint;
}

// ============================================================================
// Move Sequencing
// ============================================================================

bool MotionEmitter::activateNext() {
    if (buffer_.empty()) {
        return false;
    }

    PlannedMove move = std::move(buffer_.front());
    buffer_.pop_front();

    // Entry continuity guard
    double planned = move.profile.entryVelocity();
    if (move.state != PlanState::SUPERSEDED &&
        std::abs(planned - pathVelocity_) > VELOCITY_EPSILON * std::max(1.0, planned)) {
        double v0 = pathVelocity_;
        double v1 = std::min(move.profile.exitVelocity(),
                             VelocityProfiler::reachableVelocity(v0, move.length, move.limits));
        move.profile = KinematicProfile::synthesize(move.length, v0, v1, move.limits);
        LOG_INFO("Segment #{} re-synthesized for entry {:.3f} mm/s (planned {:.3f})",
                 move.id, v0, planned);
    }

    Vector3d start = move.segment.pointAt(move.startOffset);
    double gap = (start - holdPosition_).norm();
    if (gap > CONTINUITY_TOLERANCE) {
        LOG_WARN("Path discontinuity of {:.4f} mm before segment #{}", gap, move.id);
    }

    state_ = (move.state == PlanState::SUPERSEDED) ? EmitterState::STOPPING
                                                   : EmitterState::RUNNING;
    active_ = std::move(move);
    lastProgress_ = 0;
    return true;
}

void MotionEmitter::completeActive() {
    Vector3d tangent, normal;
    double curvature = 0;
    pathState(active_->segment, active_->endOffset(),
              holdPosition_, tangent, normal, curvature);

    pathVelocity_ = active_->profile.exitVelocity();
    lastProgress_ = 0;
    active_.reset();
}

// ============================================================================
// Cancellation
// ============================================================================

void MotionEmitter::handleCancel() {
    if (!active_ || pathVelocity_ <= VELOCITY_EPSILON) {
        active_.reset();
        buffer_.clear();
        pathVelocity_ = 0;
        state_ = EmitterState::IDLE;
        LOG_INFO("Motion cancelled at standstill");
        return;
    }

    double v = pathVelocity_;
    double offset = active_->startOffset + lastProgress_;
    PlannedMove current = std::move(*active_);
    active_.reset();

    std::deque<PlannedMove> stops;
    double stoppingDistance = 0;

    while (true) {
        double a = current.limits.aMax;
        double remaining = std::max(current.endOffset() - offset, 0.0);
        double needed = v * v / (2.0 * a);

        PlannedMove stop = current;
        stop.startOffset = offset;
        stop.state = PlanState::SUPERSEDED;

        if (needed <= remaining || buffer_.empty()) {
            if (needed > remaining) {
                LOG_ERROR("Stop overruns segment #{} by {:.4f} mm", current.id, needed - remaining);
            }
            stop.profile = KinematicProfile::decelerateToStop(v, a);
            stop.length = stop.profile.length();
            stoppingDistance += needed;
            stops.push_back(std::move(stop));
            break;
        }

        // Brake through the rest of this segment into the next one
        double vThrough = std::sqrt(std::max(v * v - 2.0 * a * remaining, 0.0));
        if (remaining > EPSILON) {
            stop.profile = KinematicProfile::synthesize(remaining, v, vThrough,
                                                        std::max(current.limits.vMax, v), a);
            stop.length = remaining;
            stoppingDistance += remaining;
            stops.push_back(std::move(stop));
        }

        v = vThrough;
        current = std::move(buffer_.front());
        buffer_.pop_front();
        offset = current.startOffset;
    }

    LOG_INFO("Motion cancelled at {:.3f} mm/s, stopping within {:.3f} mm",
             pathVelocity_, stoppingDistance);

    buffer_ = std::move(stops);
    active_ = std::move(buffer_.front());
    buffer_.pop_front();
    localTime_ = 0;
    lastProgress_ = 0;
    state_ = EmitterState::STOPPING;
}

// ============================================================================
// Underrun Detection
// ============================================================================

void MotionEmitter::checkUnderrun(const ProfileSample& sample) {
    if (!buffer_.empty() || !active_ || active_->state == PlanState::SUPERSEDED) {
        return;
    }
    if (active_->profile.exitVelocity() <= VELOCITY_EPSILON) {
        return;
    }

    // Must brake now if one more tick could make stopping on the segment impossible
    double v = sample.velocity;
    double a = active_->limits.aMax;
    double dt = tickPeriod_;
    double remaining = active_->profile.length() - sample.position;
    double margin = v * v / (2.0 * a) + 2.0 * v * dt + 2.0 * a * dt * dt;
    if (margin < remaining) {
        return;
    }

    ++underrunCount_;
    LOG_WARN("Planner underrun on segment #{}: decelerating to hold", active_->id);

    if (v <= VELOCITY_EPSILON) {
        completeActive();
        pathVelocity_ = 0;
        state_ = EmitterState::IDLE;
        return;
    }

    double deceleration = a;
    if (remaining > EPSILON) {
        deceleration = v * v / (2.0 * remaining);
        if (deceleration > a) {
            LOG_ERROR("Underrun stop on segment #{} overruns by {:.4f} mm",
                      active_->id, v * v / (2.0 * a) - remaining);
            deceleration = a;
        }
    }

    PlannedMove stop = *active_;
    stop.startOffset = active_->startOffset + sample.position;
    stop.profile = KinematicProfile::decelerateToStop(v, deceleration);
    stop.length = stop.profile.length();
    stop.state = PlanState::SUPERSEDED;

    active_ = std::move(stop);
    localTime_ = 0;
    lastProgress_ = 0;
    state_ = EmitterState::STOPPING;
}

PlannedMove MotionEmitter::stopBeyond(const PlannedMove& finished, double velocity) const {
    PlannedMove stop = finished;
    stop.startOffset = finished.endOffset();
    stop.profile = KinematicProfile::decelerateToStop(velocity, finished.limits.aMax);
    stop.length = stop.profile.length();
    stop.state = PlanState::SUPERSEDED;
    return stop;
}

// ============================================================================
// Sampling
// ============================================================================

void MotionEmitter::pathState(const Segment& segment, double s,
                              Vector3d& position, Vector3d& tangent,
                              Vector3d& normal, double& curvature) const {
    double length = segment.length();
    if (s <= length) {
        position = segment.pointAt(s);
        tangent = segment.tangentAt(s);
        normal = segment.normalAt(s);
        curvature = segment.curvature();
        return;
    }

    tangent = segment.endTangent();
    position = segment.endPoint() + tangent * (s - length);
    normal = Vector3d::Zero();
    curvature = 0;
}

AxisSetpoint MotionEmitter::sampleActive() {
    ProfileSample sample = active_->profile.evaluate(localTime_);
    lastProgress_ = sample.position;
    pathVelocity_ = sample.velocity;

    Vector3d tangent, normal;
    double curvature = 0;
    AxisSetpoint setpoint;
    pathState(active_->segment, active_->startOffset + sample.position,
              setpoint.position, tangent, normal, curvature);

    double v = sample.velocity;
    setpoint.time = time_;
    setpoint.velocity = tangent * v;
    setpoint.acceleration = tangent * sample.acceleration + normal * (v * v * curvature);
    setpoint.pathVelocity = v;
    setpoint.segmentId = active_->id;
    setpoint.moving = true;

    // Exceeding axis limits here is a planning defect
    assert(limiter_.withinLimits(setpoint.velocity, setpoint.acceleration));

    holdPosition_ = setpoint.position;
    return setpoint;
}

AxisSetpoint MotionEmitter::holdSetpoint() const {
    AxisSetpoint setpoint;
    setpoint.time = time_;
    setpoint.position = holdPosition_;
    setpoint.moving = false;
    return setpoint;
}

} // namespace trajectory
} // namespace motion_planner
