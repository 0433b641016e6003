/**
 * @file test_segment_queue.cpp
 * @brief Unit tests for the segment ring buffer
 */

#include <gtest/gtest.h>
#include "trajectory/SegmentQueue.hpp"
#include <vector>

using namespace motion_planner::trajectory;

static Segment lineX(double from, double to) {
    return Segment::line(Vector3d(from, 0, 0), Vector3d(to, 0, 0));
}

TEST(SegmentQueue, PushAssignsSequentialIds) {
    SegmentQueue queue(8, 4);

    for (int i = 0; i < 3; ++i) {
        auto result = queue.push(lineX(i, i + 1));
        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.error, PlannerError::NONE);
    }

    EXPECT_EQ(queue.size(), 3u);
    auto window = queue.window();
    ASSERT_EQ(window.size(), 3u);
    EXPECT_EQ(window[0].id, 0u);
    EXPECT_EQ(window[2].id, 2u);
    EXPECT_EQ(queue.nextId(), 3u);
}

TEST(SegmentQueue, ZeroLengthPushLeavesQueueUnchanged) {
    SegmentQueue queue(8, 4);
    ASSERT_TRUE(queue.push(lineX(0, 1)).success);

    auto result = queue.push(lineX(1, 1));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, PlannerError::INVALID_GEOMETRY);
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_EQ(queue.nextId(), 1u);
}

TEST(SegmentQueue, RejectsWhenFull) {
    SegmentQueue queue(2, 2);
    ASSERT_TRUE(queue.push(lineX(0, 1)).success);
    ASSERT_TRUE(queue.push(lineX(1, 2)).success);
    EXPECT_TRUE(queue.full());

    auto result = queue.push(lineX(2, 3));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, PlannerError::QUEUE_FULL);
    EXPECT_STREQ(plannerErrorToString(result.error), "queue full");
    EXPECT_EQ(queue.size(), 2u);
}

TEST(SegmentQueue, WindowLimitedToLookahead) {
    SegmentQueue queue(16, 3);
    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(queue.push(lineX(i, i + 1)).success);
    }

    EXPECT_EQ(queue.window().size(), 3u);

    queue.setLookahead(100);
    EXPECT_EQ(queue.lookahead(), 16u);
    EXPECT_EQ(queue.window().size(), 6u);
}

TEST(SegmentQueue, RetireKeepsFifoOrderAcrossWrap) {
    SegmentQueue queue(3, 3);
    ASSERT_TRUE(queue.push(lineX(0, 1)).success);
    ASSERT_TRUE(queue.push(lineX(1, 2)).success);
    ASSERT_TRUE(queue.push(lineX(2, 3)).success);

    EXPECT_EQ(queue.retire(2), 2u);
    ASSERT_TRUE(queue.push(lineX(3, 4)).success);
    ASSERT_TRUE(queue.push(lineX(4, 5)).success);

    std::vector<uint64_t> ids;
    for (const auto& queued : queue.window()) {
        ids.push_back(queued.id);
    }
    EXPECT_EQ(ids, (std::vector<uint64_t>{2, 3, 4}));
    EXPECT_TRUE(queue.window()[0].segment.startPoint().isApprox(Vector3d(2, 0, 0)));
}

TEST(SegmentQueue, ClearEmptiesButKeepsNumbering) {
    SegmentQueue queue(4, 4);
    ASSERT_TRUE(queue.push(lineX(0, 1)).success);
    ASSERT_TRUE(queue.push(lineX(1, 2)).success);

    queue.clear();
    EXPECT_TRUE(queue.empty());
    EXPECT_TRUE(queue.window().empty());
    EXPECT_EQ(queue.retire(5), 0u);

    ASSERT_TRUE(queue.push(lineX(2, 3)).success);
    EXPECT_EQ(queue.window()[0].id, 2u);
}

TEST(SegmentQueueDeathTest, WindowIndexBeyondWindow) {
    SegmentQueue queue(16, 3);
    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(queue.push(lineX(i, i + 1)).success);
    }

    // Queued but outside the lookahead window
    auto window = queue.window();
    ASSERT_EQ(window.size(), 3u);
    EXPECT_DEBUG_DEATH(window[3], "");
}
