/**
 * @file MotionPlanner.hpp
 * @brief Segment queue -> finalized kinematic profiles
 *
 * Each planning run rebuilds the lookahead window from the queue head:
 *   - AxisLimiter bounds every segment
 *   - CornerBlender bounds every interior junction
 *   - VelocityProfiler runs the forward and backward passes
 * and then finalizes head segments into PlannedMoves. The last junction
 * of the window is always planned to standstill, so any finalized prefix
 * can be brought to a stop inside the window.
 *
 * In BLEND mode a rounded line/line corner becomes three window items:
 * the incoming line shortened by ℓ, the blend arc, and the outgoing line
 * starting ℓ after its start point. Finalizing a queued segment finalizes
 * its (trimmed) body and the blend arc that follows it. The outgoing trim
 * is carried to the next run as the new head's start offset.
 *
 * The PlanningContext is passed into every run and is only read.
 */

#pragma once

#include "AxisLimiter.hpp"
#include "CornerBlender.hpp"
#include "KinematicProfile.hpp"
#include "PlannerTypes.hpp"
#include "SegmentQueue.hpp"
#include "VelocityProfiler.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace motion_planner {
namespace trajectory {

/**
 * A finalized segment, ready for emission
 */
struct PlannedMove {
    uint64_t id = 0;               // Queued segment id (a blend carries its incoming segment's id)
    Segment segment = Segment::line(Vector3d::Zero(), Vector3d::UnitX());
    SegmentLimits limits;
    KinematicProfile profile;
    double startOffset = 0;        // Arc length at which the profile starts (mm)
    double length = 0;             // Arc length covered from startOffset (mm)
    bool blend = false;            // Corner-rounding arc inserted by the planner
    PlanState state = PlanState::FINALIZED;

    double endOffset() const { return startOffset + length; }
};

/**
 * One item of the planning window: a queued segment (possibly trimmed at
 * either end by blend arcs) or a blend arc
 */
struct WindowItem {
    uint64_t id = 0;
    Segment segment = Segment::line(Vector3d::Zero(), Vector3d::UnitX());
    double startOffset = 0;
    double length = 0;
    double exitTrim = 0;           // Cut from the end by the following blend (mm)
    bool blend = false;
};

/**
 * Result of a planning run
 */
struct PlanResult {
    bool success = false;
    PlannerError error = PlannerError::NONE;
    std::string message;
    std::vector<PlannedMove> moves;   // Newly finalized, in execution order
};

class MotionPlanner {
public:
    explicit MotionPlanner(size_t queueCapacity = SegmentQueue::DEFAULT_CAPACITY);

    /**
     * Validate and queue a segment
     */
    PushResult push(const Segment& segment);

    /**
     * Streaming run: finalize head segments while the lookahead window is full
     */
    PlanResult plan(const PlanningContext& context);

    /**
     * Finalize up to count head segments regardless of window occupancy
     */
    PlanResult planHead(const PlanningContext& context, size_t count);

    /**
     * Finalize every queued segment (end of program)
     */
    PlanResult flush(const PlanningContext& context);

    /**
     * Run the passes over the current window without finalizing anything.
     * Entries are BACKWARD_CORRECTED on success, one per window item.
     */
    PlanResult preview(const PlanningContext& context,
                       std::vector<WindowEntry>& entries);

    PlanResult preview(const PlanningContext& context,
                       std::vector<WindowItem>& items,
                       std::vector<WindowEntry>& entries);

    /**
     * Drop all queued segments and restart from the given entry velocity
     */
    void reset(double entryVelocity = 0);

    const SegmentQueue& queue() const { return queue_; }

    /**
     * Entry velocity of the next segment to be finalized
     */
    double entryVelocity() const { return entryVelocity_; }

    /**
     * Arc length already covered by the blend that ends the last finalized segment
     */
    double headTrim() const { return headTrim_; }

private:
    bool checkContext(const PlanningContext& context, PlanResult& result) const;

    // Sizes the queue window from the context, inserts blend arcs and
    // bounds every item and junction
    void buildWindow(const PlanningContext& context,
                     std::vector<WindowItem>& items,
                     std::vector<WindowEntry>& entries);

    // One run over the window, finalizing its first segment
    void finalizeHead(const PlanningContext& context, PlanResult& result);

    SegmentQueue queue_;
    VelocityProfiler profiler_;
    double entryVelocity_ = 0;
    double headTrim_ = 0;
};

} // namespace trajectory
} // namespace motion_planner
