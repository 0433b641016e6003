/**
 * @file MotionPlanner.cpp
 * @brief Look-ahead planning runs over the segment queue
 */

#include "MotionPlanner.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <optional>

namespace motion_planner {
namespace trajectory {

MotionPlanner::MotionPlanner(size_t queueCapacity)
    : queue_(queueCapacity) {
}

PushResult MotionPlanner::push(const Segment& segment) {
    return queue_.push(segment);
}

void MotionPlanner::reset(double entryVelocity) {
    queue_.clear();
    entryVelocity_ = std::max(entryVelocity, 0.0);
    headTrim_ = 0;
}

// ============================================================================
// Window Construction
// ============================================================================

bool MotionPlanner::checkContext(const PlanningContext& context, PlanResult& result) const {
    std::string error;
    if (!context.validate(error)) {
        result.success = false;
        result.error = PlannerError::INFEASIBLE_LIMITS;
        result.message = error;
        LOG_ERROR("Refusing to plan: {}", error);
        return false;
    }
    return true;
}

void MotionPlanner::buildWindow(const PlanningContext& context,
                                std::vector<WindowItem>& items,
                                std::vector<WindowEntry>& entries) {
    AxisLimiter limiter(context.axisLimits, context.profile == ProfileType::S_CURVE);
    CornerBlender blender(context.tolerance, context.colinearTolerance);

    queue_.setLookahead(context.lookahead);
    auto window = queue_.window();

    items.clear();
    entries.clear();
    items.reserve(2 * window.size());
    entries.reserve(2 * window.size());

    double startTrim = headTrim_;
    for (size_t i = 0; i < window.size(); ++i) {
        const QueuedSegment& queued = window[i];
        const Segment* next = (i + 1 < window.size()) ? &window[i + 1].segment : nullptr;

        WindowItem body;
        body.id = queued.id;
        body.segment = queued.segment;
        body.startOffset = startTrim;
        body.exitTrim = next ? blender.trimLength(queued.segment, *next) : 0.0;
        body.length = std::max(queued.segment.length() - startTrim - body.exitTrim, 0.0);

        WindowEntry entry;
        entry.length = body.length;
        entry.limits = limiter.limitsFor(queued.segment);

        if (items.empty()) {
            entry.junctionLimit = entryVelocity_;
        } else if (items.back().blend) {
            // Tangent-continuous exit of a blend arc
            entry.junctionLimit = std::min(entries.back().limits.vMax, entry.limits.vMax);
        } else {
            entry.junctionLimit = blender.junctionVelocity(
                items.back().segment, entries.back().limits,
                queued.segment, entry.limits);
        }

        items.push_back(body);
        entries.push_back(entry);

        std::optional<Segment> arc;
        if (next) {
            arc = blender.blendArc(queued.segment, *next);
        }
        if (arc) {
            WindowItem blend;
            blend.id = queued.id;
            blend.segment = *arc;
            blend.length = arc->length();
            blend.blend = true;

            WindowEntry blendEntry;
            blendEntry.length = blend.length;
            blendEntry.limits = limiter.limitsFor(*arc);

            double corner = blender.junctionVelocity(queued.segment, entry.limits,
                                                     *next, limiter.limitsFor(*next));
            blendEntry.junctionLimit = std::min({corner, entry.limits.vMax,
                                                 blendEntry.limits.vMax});

            items.push_back(blend);
            entries.push_back(blendEntry);
        }

        startTrim = body.exitTrim;
    }
}

// ============================================================================
// Planning Runs
// ============================================================================

void MotionPlanner::finalizeHead(const PlanningContext& context, PlanResult& result) {
    std::vector<WindowItem> items;
    std::vector<WindowEntry> entries;
    buildWindow(context, items, entries);
    if (items.empty()) return;

    uint64_t headId = items.front().id;
    if (!profiler_.plan(entries, entryVelocity_, 0.0)) {
        LOG_WARN("Segment #{} entered at {:.3f} mm/s, above what the window allows",
                 headId, entryVelocity_);
    }

    // The head's body, then the blend arc that rounds its exit corner
    for (size_t i = 0; i < items.size() && items[i].id == headId; ++i) {
        const WindowItem& item = items[i];
        const WindowEntry& entry = entries[i];

        // Consumed entirely by the blends on both ends
        if (item.length <= EPSILON) {
            entryVelocity_ = entry.vExit;
            continue;
        }

        PlannedMove move;
        move.id = item.id;
        move.segment = item.segment;
        move.limits = entry.limits;
        move.profile = profiler_.synthesize(entry);
        move.startOffset = item.startOffset;
        move.length = item.length;
        move.blend = item.blend;
        move.state = PlanState::FINALIZED;

        LOG_DEBUG("Finalized {} #{}: L={:.3f} v {:.3f} -> {:.3f} (peak {:.3f}, vmax {:.3f}), {:.4f}s",
                  move.blend ? "blend after segment" : "segment", move.id, move.length,
                  move.profile.entryVelocity(), move.profile.exitVelocity(),
                  move.profile.peakVelocity(), entry.limits.vMax, move.profile.duration());

        entryVelocity_ = move.profile.exitVelocity();
        result.moves.push_back(std::move(move));
    }

    headTrim_ = items.front().exitTrim;
    queue_.retire(1);
}

PlanResult MotionPlanner::plan(const PlanningContext& context) {
    PlanResult result;
    if (!checkContext(context, result)) return result;

    size_t windowSize = std::min(context.lookahead, queue_.capacity());
    while (!queue_.empty() && queue_.size() >= windowSize) {
        finalizeHead(context, result);
    }

    result.success = true;
    return result;
}

PlanResult MotionPlanner::planHead(const PlanningContext& context, size_t count) {
    PlanResult result;
    if (!checkContext(context, result)) return result;

    for (size_t i = 0; i < count && !queue_.empty(); ++i) {
        finalizeHead(context, result);
    }

    result.success = true;
    return result;
}

PlanResult MotionPlanner::flush(const PlanningContext& context) {
    PlanResult result;
    if (!checkContext(context, result)) return result;

    while (!queue_.empty()) {
        finalizeHead(context, result);
    }

    if (!result.moves.empty()) {
        LOG_DEBUG("Flushed {} moves", result.moves.size());
    }
    result.success = true;
    return result;
}

PlanResult MotionPlanner::preview(const PlanningContext& context,
                                  std::vector<WindowEntry>& entries) {
    std::vector<WindowItem> items;
    return preview(context, items, entries);
}

PlanResult MotionPlanner::preview(const PlanningContext& context,
                                  std::vector<WindowItem>& items,
                                  std::vector<WindowEntry>& entries) {
    PlanResult result;
    if (!checkContext(context, result)) return result;

    buildWindow(context, items, entries);
    profiler_.plan(entries, entryVelocity_, 0.0);

    result.success = true;
    return result;
}

} // namespace trajectory
} // namespace motion_planner
