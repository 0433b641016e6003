/**
 * @file SegmentQueue.hpp
 * @brief Fixed-capacity FIFO of path segments awaiting planning
 *
 * Implemented as a ring buffer indexed by position so the cost of
 * re-planning the lookahead window stays bounded. Segments are executed
 * strictly in push order.
 */

#pragma once

#include "PlannerTypes.hpp"
#include "Segment.hpp"
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <vector>

namespace motion_planner {
namespace trajectory {

/**
 * A segment together with its sequence number (push order, starts at 0)
 */
struct QueuedSegment {
    uint64_t id;
    Segment segment;
};

class SegmentQueue {
public:
    static constexpr size_t DEFAULT_CAPACITY = 64;
    static constexpr size_t DEFAULT_LOOKAHEAD = 16;

    /**
     * Read-only view over up to N upcoming segments.
     *
     * Cheap to create and restartable: each begin() walks the ring buffer
     * from the queue head. Invalidated by push/retire.
     */
    class Window {
    public:
        class Iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = QueuedSegment;
            using difference_type = std::ptrdiff_t;
            using pointer = const QueuedSegment*;
            using reference = const QueuedSegment&;

            Iterator(const SegmentQueue* queue, size_t offset)
                : queue_(queue), offset_(offset) {}

            reference operator*() const { return queue_->at(offset_); }
            pointer operator->() const { return &queue_->at(offset_); }
            Iterator& operator++() { ++offset_; return *this; }
            Iterator operator++(int) { Iterator tmp = *this; ++offset_; return tmp; }
            bool operator==(const Iterator& other) const { return offset_ == other.offset_; }
            bool operator!=(const Iterator& other) const { return offset_ != other.offset_; }

        private:
            const SegmentQueue* queue_;
            size_t offset_;
        };

        Window(const SegmentQueue* queue, size_t count)
            : queue_(queue), count_(count) {}

        size_t size() const { return count_; }
        bool empty() const { return count_ == 0; }
        const QueuedSegment& operator[](size_t i) const {
            assert(i < count_);
            return queue_->at(i);
        }

        Iterator begin() const { return Iterator(queue_, 0); }
        Iterator end() const { return Iterator(queue_, count_); }

    private:
        const SegmentQueue* queue_;
        size_t count_;
    };

    explicit SegmentQueue(size_t capacity = DEFAULT_CAPACITY,
                          size_t lookahead = DEFAULT_LOOKAHEAD);

    /**
     * Validate and append a segment.
     *
     * Fails with INVALID_GEOMETRY for degenerate segments and QUEUE_FULL
     * when the ring buffer is at capacity. The queue is unchanged on failure.
     */
    PushResult push(const Segment& segment);

    /**
     * Up to lookahead() segments from the front of the queue
     */
    Window window() const;

    /**
     * Remove finalized segments from the front.
     * @return Number of segments actually removed
     */
    size_t retire(size_t count);

    void clear();

    /**
     * Resize the lookahead window (clamped to [1, capacity])
     */
    void setLookahead(size_t lookahead);

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    bool full() const { return count_ == slots_.size(); }
    size_t capacity() const { return slots_.size(); }
    size_t lookahead() const { return lookahead_; }

    /**
     * Sequence number the next pushed segment will receive
     */
    uint64_t nextId() const { return nextId_; }

private:
    const QueuedSegment& at(size_t offset) const;

    std::vector<std::optional<QueuedSegment>> slots_;
    size_t head_ = 0;
    size_t count_ = 0;
    size_t lookahead_;
    uint64_t nextId_ = 0;
};

} // namespace trajectory
} // namespace motion_planner
