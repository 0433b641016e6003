/**
 * @file MotionPipeline.hpp
 * @brief Planner + emitter driver for one motion program
 *
 * The pipeline owns the planning context. Planning never runs inside
 * tick():
 *   - push() queues a segment and delivers every head that a full
 *     lookahead window finalizes
 *   - flush() finalizes the rest of the program to standstill
 *   - service() tops the emitter up to the configured horizon of motion,
 *     finalizing heads early when the window is not full
 * service() is called by the owner between ticks, or periodically by the
 * planning thread started with startPlanning(). tick() only samples the
 * emitter. Tolerance changes apply to junctions that are not yet
 * finalized.
 */

#pragma once

#include "MotionEmitter.hpp"
#include "MotionPlanner.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

namespace motion_planner {
namespace trajectory {

struct PipelineConfig {
    PlanningContext context;
    double tickPeriod = 0.001;          // s
    double bufferHorizon = 0.05;        // s of motion kept ahead of the emitter
    size_t queueCapacity = SegmentQueue::DEFAULT_CAPACITY;
};

class MotionPipeline {
public:
    explicit MotionPipeline(const PipelineConfig& config);
    ~MotionPipeline();

    // Non-copyable (planning thread)
    MotionPipeline(const MotionPipeline&) = delete;
    MotionPipeline& operator=(const MotionPipeline&) = delete;

    PushResult push(const Segment& segment);

    /**
     * Planning step: keep the emitter fed up to the buffer horizon
     */
    void service();

    /**
     * Run service() on a background thread every period
     */
    bool startPlanning(std::chrono::milliseconds period = std::chrono::milliseconds(1));
    void stopPlanning();
    bool isPlanning() const { return planning_.load(); }

    /**
     * Produce the next setpoint from already finalized moves
     */
    AxisSetpoint tick();

    /**
     * End of program: finalize all queued segments to standstill
     */
    PlanResult flush();

    /**
     * Controlled stop; queued segments are dropped
     */
    void cancel();

    bool setToleranceMode(const ToleranceMode& mode);
    void setPosition(const Vector3d& position) { emitter_.setPosition(position); }

    bool isIdle() const;
    bool isConfigured() const { return configured_; }

    PlanningContext context() const;
    const MotionPlanner& planner() const { return planner_; }
    const MotionEmitter& emitter() const { return emitter_; }

private:
    void feedEmitter();
    void deliver(PlanResult& result);
    void planningLoop();

    PipelineConfig config_;
    bool configured_ = false;
    bool draining_ = false;   // flush() requested, finalize without waiting for a full window
    MotionPlanner planner_;
    MotionEmitter emitter_;

    // Guards planner_, config_.context and draining_
    mutable std::mutex planMutex_;

    std::thread planningThread_;
    std::atomic<bool> planning_{false};
    std::chrono::milliseconds planningPeriod_{1};
};

} // namespace trajectory
} // namespace motion_planner
