/**
 * @file test_velocity_profiler.cpp
 * @brief Unit tests for the forward/backward look-ahead passes
 */

#include <gtest/gtest.h>
#include "trajectory/VelocityProfiler.hpp"
#include <cmath>
#include <vector>

using namespace motion_planner::trajectory;

// ============================================================================
// Helper: Create a window entry
// ============================================================================

static WindowEntry makeEntry(double length, double junction,
                             double vMax = 100.0, double aMax = 1000.0) {
    WindowEntry entry;
    entry.length = length;
    entry.limits.vMax = vMax;
    entry.limits.aMax = aMax;
    entry.junctionLimit = junction;
    return entry;
}

static void expectConsistent(const std::vector<WindowEntry>& entries) {
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        double maxEntry = std::sqrt(e.vExit * e.vExit + 2.0 * e.limits.aMax * e.length);
        EXPECT_LE(e.vEntry, maxEntry + 1e-9) << "segment " << i;
        EXPECT_LE(e.vEntry, e.limits.vMax + 1e-9) << "segment " << i;
        EXPECT_LE(e.vExit, e.limits.vMax + 1e-9) << "segment " << i;
        if (i > 0) {
            EXPECT_DOUBLE_EQ(entries[i - 1].vExit, e.vEntry) << "junction " << i;
            EXPECT_LE(e.vEntry, e.junctionLimit + 1e-9) << "junction " << i;
        }
    }
}

TEST(VelocityProfiler, ColinearRunKeepsSpeed) {
    VelocityProfiler profiler;
    std::vector<WindowEntry> entries = {
        makeEntry(20, 0), makeEntry(20, 100), makeEntry(20, 100), makeEntry(20, 100)
    };

    ASSERT_TRUE(profiler.plan(entries, 0.0, 0.0));
    expectConsistent(entries);

    EXPECT_NEAR(entries[1].vEntry, 100.0, 1e-9);
    EXPECT_NEAR(entries[2].vEntry, 100.0, 1e-9);
    EXPECT_NEAR(entries[3].vEntry, 100.0, 1e-9);
    EXPECT_NEAR(entries[3].vExit, 0.0, 1e-12);
    for (const auto& e : entries) {
        EXPECT_EQ(e.state, PlanState::BACKWARD_CORRECTED);
    }
}

TEST(VelocityProfiler, JunctionLimitRespected) {
    VelocityProfiler profiler;
    std::vector<WindowEntry> entries = {
        makeEntry(20, 0), makeEntry(20, 15), makeEntry(20, 100)
    };

    ASSERT_TRUE(profiler.plan(entries, 0.0, 0.0));
    expectConsistent(entries);
    EXPECT_NEAR(entries[0].vExit, 15.0, 1e-9);
    EXPECT_NEAR(entries[1].vEntry, 15.0, 1e-9);
}

TEST(VelocityProfiler, ShortSegmentBeforeStop) {
    VelocityProfiler profiler;
    std::vector<WindowEntry> entries = {
        makeEntry(50, 0), makeEntry(0.1, 100), makeEntry(50, 0)
    };

    // Must be stopped at the start of the last segment
    ASSERT_TRUE(profiler.plan(entries, 0.0, 0.0));
    expectConsistent(entries);

    EXPECT_NEAR(entries[1].vExit, 0.0, 1e-12);
    EXPECT_NEAR(entries[1].vEntry, std::sqrt(2.0 * 1000.0 * 0.1), 1e-9);
    EXPECT_NEAR(entries[0].vExit, entries[1].vEntry, 1e-12);
}

TEST(VelocityProfiler, BackwardPassIsIdempotent) {
    VelocityProfiler profiler;
    std::vector<WindowEntry> entries = {
        makeEntry(5, 0), makeEntry(1, 80), makeEntry(0.5, 60),
        makeEntry(30, 100), makeEntry(2, 40), makeEntry(10, 100)
    };

    ASSERT_TRUE(profiler.plan(entries, 0.0, 0.0));
    std::vector<WindowEntry> once = entries;

    ASSERT_TRUE(profiler.backwardPass(entries, 0.0));
    for (size_t i = 0; i < entries.size(); ++i) {
        EXPECT_DOUBLE_EQ(entries[i].vEntry, once[i].vEntry) << "segment " << i;
        EXPECT_DOUBLE_EQ(entries[i].vExit, once[i].vExit) << "segment " << i;
    }
}

TEST(VelocityProfiler, NonZeroWindowExit) {
    VelocityProfiler profiler;
    std::vector<WindowEntry> entries = { makeEntry(20, 0), makeEntry(20, 100) };

    ASSERT_TRUE(profiler.plan(entries, 0.0, 60.0));
    EXPECT_NEAR(entries[1].vExit, 60.0, 1e-9);
}

TEST(VelocityProfiler, InfeasibleFixedEntryRaisesJunction) {
    VelocityProfiler profiler;
    std::vector<WindowEntry> entries = { makeEntry(1, 0), makeEntry(1, 0) };

    // Entering at 100 mm/s, 1 mm of braking only reaches sqrt(100² - 2000)
    EXPECT_FALSE(profiler.plan(entries, 100.0, 0.0));
    EXPECT_NEAR(entries[0].vEntry, 100.0, 1e-12);
    EXPECT_NEAR(entries[0].vExit, std::sqrt(100.0 * 100.0 - 2000.0), 1e-9);

    // Committed segment is still a valid braking profile
    auto profile = profiler.synthesize(entries[0]);
    EXPECT_NEAR(profile.integratedDistance(), 1.0, 1e-9);
    EXPECT_NEAR(profile.exitVelocity(), entries[0].vExit, 1e-9);
}

TEST(VelocityProfiler, SynthesizedProfilesMatchEntries) {
    VelocityProfiler profiler;
    std::vector<WindowEntry> entries = {
        makeEntry(3, 0), makeEntry(7, 50), makeEntry(0.2, 100), makeEntry(12, 30)
    };
    ASSERT_TRUE(profiler.plan(entries, 0.0, 0.0));

    for (const auto& e : entries) {
        auto profile = profiler.synthesize(e);
        EXPECT_NEAR(profile.entryVelocity(), e.vEntry, 1e-9);
        EXPECT_NEAR(profile.exitVelocity(), e.vExit, 1e-9);
        EXPECT_NEAR(profile.integratedDistance(), e.length, 1e-9);
        EXPECT_LE(profile.peakVelocity(), e.limits.vMax + 1e-9);
    }
}
