/**
 * @file MotionPipeline.cpp
 * @brief Planner + emitter driver
 */

#include "MotionPipeline.hpp"
#include "../logging/Logger.hpp"

namespace motion_planner {
namespace trajectory {

namespace {

constexpr size_t MIN_BUFFERED_MOVES = 2;

} // namespace

MotionPipeline::MotionPipeline(const PipelineConfig& config)
    : config_(config),
      planner_(config.queueCapacity),
      emitter_(config.context.axisLimits, config.tickPeriod) {
    std::string error;
    configured_ = config_.context.validate(error);
    if (!configured_) {
        LOG_ERROR("Motion pipeline not configured: {}", error);
    }
}

MotionPipeline::~MotionPipeline() {
    stopPlanning();
}

PushResult MotionPipeline::push(const Segment& segment) {
    if (!configured_) {
        return {false, PlannerError::NOT_CONFIGURED, "Planning context is invalid"};
    }

    std::lock_guard<std::mutex> lock(planMutex_);
    PushResult result = planner_.push(segment);
    if (result.success) {
        draining_ = false;
        PlanResult streamed = planner_.plan(config_.context);
        deliver(streamed);
    }
    return result;
}

void MotionPipeline::deliver(PlanResult& result) {
    if (!result.success || result.moves.empty()) return;
    emitter_.enqueue(std::move(result.moves));
}

void MotionPipeline::feedEmitter() {
    // Full windows first, they carry the best junction speeds
    PlanResult streamed = planner_.plan(config_.context);
    deliver(streamed);

    // A move may complete inside the coming tick, keep two successors
    while (!planner_.queue().empty() &&
           (draining_ || emitter_.bufferedMoves() < MIN_BUFFERED_MOVES ||
            emitter_.bufferedTime() < config_.bufferHorizon)) {
        PlanResult head = planner_.planHead(config_.context, 1);
        if (!head.success) break;
        deliver(head);
    }
}

void MotionPipeline::service() {
    if (!configured_) return;

    std::lock_guard<std::mutex> lock(planMutex_);
    feedEmitter();
}

// ============================================================================
// Planning Thread
// ============================================================================

bool MotionPipeline::startPlanning(std::chrono::milliseconds period) {
    if (!configured_ || planning_.load()) {
        return false;
    }

    planningPeriod_ = period;
    planning_.store(true);
    planningThread_ = std::thread(&MotionPipeline::planningLoop, this);
    LOG_INFO("Planning thread started, period {} ms", period.count());
    return true;
}

void MotionPipeline::stopPlanning() {
    planning_.store(false);
    if (planningThread_.joinable()) {
        planningThread_.join();
        LOG_INFO("Planning thread stopped");
    }
}

void MotionPipeline::planningLoop() {
    while (planning_.load()) {
        service();
        std::this_thread::sleep_for(planningPeriod_);
    }
}

// ============================================================================
// Execution
// ============================================================================

AxisSetpoint MotionPipeline::tick() {
    return emitter_.tick();
}

PlanResult MotionPipeline::flush() {
    if (!configured_) {
        PlanResult result;
        result.error = PlannerError::NOT_CONFIGURED;
        result.message = "Planning context is invalid";
        return result;
    }

    std::lock_guard<std::mutex> lock(planMutex_);
    draining_ = true;
    PlanResult result = planner_.flush(config_.context);
    PlanResult delivered = result;
    deliver(delivered);
    return result;
}

void MotionPipeline::cancel() {
    std::lock_guard<std::mutex> lock(planMutex_);
    size_t dropped = planner_.queue().size();
    planner_.reset(0);
    emitter_.cancel();
    draining_ = false;
    LOG_INFO("Pipeline cancelled, {} queued segments dropped", dropped);
}

bool MotionPipeline::setToleranceMode(const ToleranceMode& mode) {
    std::lock_guard<std::mutex> lock(planMutex_);
    PlanningContext candidate = config_.context;
    candidate.tolerance = mode;

    std::string error;
    if (!candidate.validate(error)) {
        LOG_ERROR("Rejected tolerance mode: {}", error);
        return false;
    }

    config_.context = candidate;
    return true;
}

PlanningContext MotionPipeline::context() const {
    std::lock_guard<std::mutex> lock(planMutex_);
    return config_.context;
}

bool MotionPipeline::isIdle() const {
    std::lock_guard<std::mutex> lock(planMutex_);
    return planner_.queue().empty() && emitter_.isIdle();
}

} // namespace trajectory
} // namespace motion_planner
