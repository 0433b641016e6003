/**
 * @file test_kinematic_profile.cpp
 * @brief Unit tests for trapezoidal / triangular / S-curve profile synthesis
 */

#include <gtest/gtest.h>
#include "trajectory/KinematicProfile.hpp"
#include <cmath>

using namespace motion_planner::trajectory;

// Integrate a profile numerically by sampling
static double sampledDistance(const KinematicProfile& profile, int steps = 20000) {
    double dt = profile.duration() / steps;
    double distance = 0;
    for (int i = 0; i < steps; ++i) {
        double v0 = profile.evaluate(i * dt).velocity;
        double v1 = profile.evaluate((i + 1) * dt).velocity;
        distance += 0.5 * (v0 + v1) * dt;
    }
    return distance;
}

TEST(KinematicProfile, TrapezoidFromRest) {
    auto profile = KinematicProfile::synthesize(20.0, 0.0, 0.0, 100.0, 1000.0);

    EXPECT_TRUE(profile.hasCruise());
    EXPECT_FALSE(profile.isTriangular());
    ASSERT_EQ(profile.phases().size(), 3u);
    EXPECT_EQ(profile.phases()[0].type, PhaseType::ACCELERATE);
    EXPECT_EQ(profile.phases()[1].type, PhaseType::CRUISE);
    EXPECT_EQ(profile.phases()[2].type, PhaseType::DECELERATE);

    // 0.1s up, 0.1s cruise (10mm), 0.1s down
    EXPECT_NEAR(profile.duration(), 0.3, 1e-12);
    EXPECT_NEAR(profile.peakVelocity(), 100.0, 1e-12);
    EXPECT_NEAR(profile.integratedDistance(), 20.0, 1e-9);
}

TEST(KinematicProfile, TriangleWhenTooShort) {
    auto profile = KinematicProfile::synthesize(2.0, 0.0, 0.0, 100.0, 1000.0);

    EXPECT_TRUE(profile.isTriangular());
    EXPECT_NEAR(profile.peakVelocity(), std::sqrt(2000.0), 1e-9);
    EXPECT_LT(profile.peakVelocity(), 100.0);
    EXPECT_NEAR(profile.integratedDistance(), 2.0, 1e-9);
}

TEST(KinematicProfile, NonZeroBoundaryVelocities) {
    auto profile = KinematicProfile::synthesize(10.0, 50.0, 20.0, 100.0, 1000.0);

    EXPECT_NEAR(profile.entryVelocity(), 50.0, 1e-12);
    EXPECT_NEAR(profile.exitVelocity(), 20.0, 1e-12);
    EXPECT_NEAR(profile.integratedDistance(), 10.0, 1e-9);
    EXPECT_NEAR(sampledDistance(profile), 10.0, 1e-4);
}

TEST(KinematicProfile, ExitCappedByReachableVelocity) {
    auto profile = KinematicProfile::synthesize(1.0, 0.0, 100.0, 100.0, 1000.0);

    EXPECT_NEAR(profile.exitVelocity(), std::sqrt(2000.0), 1e-9);
    ASSERT_EQ(profile.phases().size(), 1u);
    EXPECT_EQ(profile.phases()[0].type, PhaseType::ACCELERATE);
    EXPECT_NEAR(profile.integratedDistance(), 1.0, 1e-9);
}

TEST(KinematicProfile, CruiseOnlyAtLimit) {
    auto profile = KinematicProfile::synthesize(10.0, 100.0, 100.0, 100.0, 1000.0);

    ASSERT_EQ(profile.phases().size(), 1u);
    EXPECT_EQ(profile.phases()[0].type, PhaseType::CRUISE);
    EXPECT_NEAR(profile.duration(), 0.1, 1e-12);
}

TEST(KinematicProfile, EvaluateBoundaries) {
    auto profile = KinematicProfile::synthesize(20.0, 0.0, 0.0, 100.0, 1000.0);

    auto start = profile.evaluate(0.0);
    EXPECT_NEAR(start.position, 0.0, 1e-12);
    EXPECT_NEAR(start.velocity, 0.0, 1e-12);

    auto accel = profile.evaluate(0.05);
    EXPECT_NEAR(accel.velocity, 50.0, 1e-9);
    EXPECT_NEAR(accel.position, 1.25, 1e-9);
    EXPECT_NEAR(accel.acceleration, 1000.0, 1e-12);

    auto cruise = profile.evaluate(0.15);
    EXPECT_NEAR(cruise.velocity, 100.0, 1e-9);
    EXPECT_NEAR(cruise.position, 10.0, 1e-9);

    auto end = profile.evaluate(1.0);
    EXPECT_NEAR(end.position, 20.0, 1e-12);
    EXPECT_NEAR(end.velocity, 0.0, 1e-12);
}

TEST(KinematicProfile, DecelerateToStop) {
    auto profile = KinematicProfile::decelerateToStop(100.0, 1000.0);

    EXPECT_NEAR(profile.duration(), 0.1, 1e-12);
    EXPECT_NEAR(profile.length(), 5.0, 1e-12);
    EXPECT_NEAR(profile.exitVelocity(), 0.0, 1e-12);
    EXPECT_NEAR(profile.evaluate(0.05).velocity, 50.0, 1e-9);
}

TEST(KinematicProfile, DegenerateInputsGiveEmptyProfile) {
    EXPECT_TRUE(KinematicProfile::synthesize(0.0, 0.0, 0.0, 100.0, 1000.0).phases().empty());
    EXPECT_TRUE(KinematicProfile::synthesize(10.0, 0.0, 0.0, 0.0, 1000.0).phases().empty());
    EXPECT_TRUE(KinematicProfile::decelerateToStop(0.0, 1000.0).phases().empty());
}

// ============================================================================
// S-Curve
// ============================================================================

TEST(KinematicProfile, SCurveFromRest) {
    auto profile = KinematicProfile::synthesizeSCurve(20.0, 0.0, 0.0, 100.0, 1000.0, 20000.0);

    EXPECT_TRUE(profile.isJerkLimited());
    EXPECT_TRUE(profile.hasCruise());
    ASSERT_EQ(profile.phases().size(), 7u);
    EXPECT_EQ(profile.phases()[3].type, PhaseType::CRUISE);

    // Each ramp: 0.05s jerk, 0.05s at a_max, 0.05s jerk, covering 7.5mm
    EXPECT_NEAR(profile.duration(), 0.35, 1e-9);
    EXPECT_NEAR(profile.peakVelocity(), 100.0, 1e-9);
    EXPECT_NEAR(profile.integratedDistance(), 20.0, 1e-9);
    EXPECT_NEAR(sampledDistance(profile), 20.0, 1e-4);
}

TEST(KinematicProfile, SCurveAccelerationIsContinuous) {
    auto profile = KinematicProfile::synthesizeSCurve(20.0, 10.0, 30.0, 100.0, 1000.0, 20000.0);
    ASSERT_GT(profile.duration(), 0.0);

    const int steps = 20000;
    double dt = profile.duration() / steps;
    double previous = profile.evaluate(0.0).acceleration;
    for (int i = 1; i < steps; ++i) {
        double a = profile.evaluate(i * dt).acceleration;
        EXPECT_LE(std::abs(a), 1000.0 + 1e-6) << "step " << i;
        EXPECT_LE(std::abs(a - previous), 20000.0 * dt + 1e-6) << "step " << i;
        previous = a;
    }
    EXPECT_NEAR(profile.evaluate(profile.duration()).velocity, 30.0, 1e-9);
}

TEST(KinematicProfile, SCurveShortSegmentStaysBelowLimits) {
    auto profile = KinematicProfile::synthesizeSCurve(0.5, 0.0, 0.0, 100.0, 1000.0, 20000.0);

    EXPECT_TRUE(profile.isJerkLimited());
    EXPECT_FALSE(profile.hasCruise());
    EXPECT_LT(profile.peakVelocity(), 100.0);
    EXPECT_NEAR(profile.integratedDistance(), 0.5, 1e-6);
    for (const auto& phase : profile.phases()) {
        EXPECT_LE(std::abs(phase.acceleration), 1000.0 + 1e-6);
        EXPECT_LE(std::abs(phase.jerk), 20000.0 + 1e-9);
    }
}

TEST(KinematicProfile, SCurveFallsBackWhenRampDoesNotFit) {
    // Braking 100 -> 0 needs 7.5mm under the jerk bound, 5mm without it
    auto profile = KinematicProfile::synthesizeSCurve(5.0, 100.0, 0.0, 100.0, 1000.0, 20000.0);

    EXPECT_FALSE(profile.isJerkLimited());
    EXPECT_NEAR(profile.exitVelocity(), 0.0, 1e-12);
    EXPECT_NEAR(profile.integratedDistance(), 5.0, 1e-9);
}

TEST(KinematicProfile, RampKinematics) {
    EXPECT_NEAR(KinematicProfile::rampDistance(0.0, 100.0, 1000.0, UNLIMITED), 5.0, 1e-12);
    EXPECT_NEAR(KinematicProfile::rampDistance(0.0, 100.0, 1000.0, 20000.0), 7.5, 1e-12);
    EXPECT_NEAR(KinematicProfile::rampDistance(100.0, 0.0, 1000.0, 20000.0), 7.5, 1e-12);

    EXPECT_NEAR(KinematicProfile::reachableVelocity(0.0, 7.5, 1000.0, 20000.0), 100.0, 1e-6);
    EXPECT_NEAR(KinematicProfile::reachableVelocity(0.0, 5.0, 1000.0, UNLIMITED), 100.0, 1e-9);

    EXPECT_NEAR(KinematicProfile::brakingVelocity(100.0, 0.0, 7.5, 1000.0, 20000.0), 0.0, 1e-12);
    double partial = KinematicProfile::brakingVelocity(100.0, 0.0, 2.0, 1000.0, 20000.0);
    EXPECT_GT(partial, 0.0);
    EXPECT_LT(partial, 100.0);
    EXPECT_LE(KinematicProfile::rampDistance(partial, 100.0, 1000.0, 20000.0), 2.0 + 1e-6);
}
