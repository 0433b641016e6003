/**
 * @file SegmentQueue.cpp
 * @brief Ring buffer of pending segments
 */

#include "SegmentQueue.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <cassert>

namespace motion_planner {
namespace trajectory {

SegmentQueue::SegmentQueue(size_t capacity, size_t lookahead)
    : slots_(std::max<size_t>(capacity, 1)),
      lookahead_(std::clamp<size_t>(lookahead, 1, std::max<size_t>(capacity, 1))) {
}

PushResult SegmentQueue::push(const Segment& segment) {
    PushResult result;

    std::string error;
    if (!segment.validate(error)) {
        result.error = PlannerError::INVALID_GEOMETRY;
        result.message = error;
        LOG_WARN("Rejected segment #{}: {}", nextId_, error);
        return result;
    }

    if (full()) {
        result.error = PlannerError::QUEUE_FULL;
        result.message = "segment queue is full (capacity " + std::to_string(capacity()) + ")";
        LOG_WARN("Rejected segment #{}: {}", nextId_, result.message);
        return result;
    }

    size_t tail = (head_ + count_) % slots_.size();
    slots_[tail].emplace(QueuedSegment{nextId_, segment});
    ++count_;
    ++nextId_;

    result.success = true;
    return result;
}

SegmentQueue::Window SegmentQueue::window() const {
    return Window(this, std::min(count_, lookahead_));
}

size_t SegmentQueue::retire(size_t count) {
    size_t removed = std::min(count, count_);
    for (size_t i = 0; i < removed; ++i) {
        slots_[head_].reset();
        head_ = (head_ + 1) % slots_.size();
    }
    count_ -= removed;
    return removed;
}

void SegmentQueue::clear() {
    retire(count_);
    head_ = 0;
}

void SegmentQueue::setLookahead(size_t lookahead) {
    lookahead_ = std::clamp<size_t>(lookahead, 1, slots_.size());
}

const QueuedSegment& SegmentQueue::at(size_t offset) const {
    assert(offset < count_);
    return *slots_[(head_ + offset) % slots_.size()];
}

} // namespace trajectory
} // namespace motion_planner
