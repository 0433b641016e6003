/**
 * @file test_config.cpp
 * @brief Configuration tests
 */

#include <gtest/gtest.h>
#include "config/ConfigManager.hpp"
#include <string>

using namespace motion_planner;
using namespace motion_planner::config;

namespace {

const char* VALID_CONFIG = R"(
planner:
  lookahead: 12
  queue_capacity: 32
  colinear_tolerance: 1.0e-5
  tolerance:
    mode: blend
    max_deviation: 0.1
  axes:
    - {name: x, max_velocity: 200, max_acceleration: 2000}
    - {name: y, max_velocity: 150, max_acceleration: 1500}
    - {name: Z, max_velocity: 50, max_acceleration: 500}
  emitter:
    tick_hz: 500
    buffer_horizon_s: 0.1
  logging:
    level: warn
    file_enabled: false
)";

const char* SCURVE_CONFIG = R"(
planner:
  profile: s_curve
  axes:
    - {name: x, max_velocity: 200, max_acceleration: 2000, max_jerk: 40000}
    - {name: y, max_velocity: 200, max_acceleration: 2000, max_jerk: 40000}
    - {name: z, max_velocity: 50, max_acceleration: 500, max_jerk: 8000}
)";

} // namespace

TEST(ConfigManager, SingletonInstance) {
    auto& instance1 = ConfigManager::instance();
    auto& instance2 = ConfigManager::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST(ConfigManager, LoadFromString) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.loadFromString(VALID_CONFIG));
    EXPECT_TRUE(manager.isLoaded());

    const PlannerConfig& config = manager.plannerConfig();
    EXPECT_EQ(config.lookahead, 12u);
    EXPECT_EQ(config.queue_capacity, 32u);
    EXPECT_DOUBLE_EQ(config.colinear_tolerance, 1e-5);
    EXPECT_EQ(config.tolerance.mode, "blend");
    ASSERT_EQ(config.axes.size(), 3u);
    EXPECT_EQ(config.emitter.tick_hz, 500);
    EXPECT_DOUBLE_EQ(config.tickPeriod(), 0.002);
    EXPECT_EQ(config.logging.level, "warn");
    EXPECT_FALSE(config.logging.file_enabled);
    EXPECT_TRUE(config.logging.console_enabled);
}

TEST(ConfigManager, ToPlanningContext) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.loadFromString(VALID_CONFIG));

    trajectory::PlanningContext context = manager.plannerConfig().toPlanningContext();
    std::string error;
    EXPECT_TRUE(context.validate(error)) << error;

    EXPECT_EQ(context.lookahead, 12u);
    EXPECT_EQ(context.tolerance.type, trajectory::ToleranceType::BLEND);
    EXPECT_DOUBLE_EQ(context.tolerance.maxDeviation, 0.1);
    EXPECT_DOUBLE_EQ(context.axisLimits.at(trajectory::Axis::Y).maxVelocity, 150.0);
    EXPECT_DOUBLE_EQ(context.axisLimits.at(trajectory::Axis::Z).maxAcceleration, 500.0);
}

TEST(ConfigManager, MissingAxisFailsAndKeepsPrevious) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.loadFromString(VALID_CONFIG));

    const char* missingZ = R"(
planner:
  lookahead: 4
  axes:
    - {name: x, max_velocity: 200, max_acceleration: 2000}
    - {name: y, max_velocity: 150, max_acceleration: 1500}
)";
    EXPECT_FALSE(manager.loadFromString(missingZ));
    EXPECT_EQ(manager.plannerConfig().lookahead, 12u);
}

TEST(ConfigManager, RejectsBadValues) {
    auto& manager = ConfigManager::instance();

    EXPECT_FALSE(manager.loadFromString("robot:\n  name: test\n"));
    EXPECT_FALSE(manager.loadFromString("planner: [unterminated\n"));

    const char* badMode = R"(
planner:
  tolerance: {mode: fillet}
  axes:
    - {name: x, max_velocity: 1, max_acceleration: 1}
    - {name: y, max_velocity: 1, max_acceleration: 1}
    - {name: z, max_velocity: 1, max_acceleration: 1}
)";
    EXPECT_FALSE(manager.loadFromString(badMode));

    const char* zeroVelocity = R"(
planner:
  axes:
    - {name: x, max_velocity: 0, max_acceleration: 1}
    - {name: y, max_velocity: 1, max_acceleration: 1}
    - {name: z, max_velocity: 1, max_acceleration: 1}
)";
    EXPECT_FALSE(manager.loadFromString(zeroVelocity));

    const char* unknownAxis = R"(
planner:
  axes:
    - {name: x, max_velocity: 1, max_acceleration: 1}
    - {name: y, max_velocity: 1, max_acceleration: 1}
    - {name: z, max_velocity: 1, max_acceleration: 1}
    - {name: a, max_velocity: 1, max_acceleration: 1}
)";
    EXPECT_FALSE(manager.loadFromString(unknownAxis));
}

TEST(ConfigManager, SCurveProfile) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.loadFromString(SCURVE_CONFIG));
    EXPECT_EQ(manager.plannerConfig().profile, "s_curve");

    trajectory::PlanningContext context = manager.plannerConfig().toPlanningContext();
    EXPECT_EQ(context.profile, trajectory::ProfileType::S_CURVE);
    EXPECT_DOUBLE_EQ(context.axisLimits.at(trajectory::Axis::X).maxJerk, 40000.0);
    EXPECT_DOUBLE_EQ(context.axisLimits.at(trajectory::Axis::Z).maxJerk, 8000.0);

    std::string json = manager.plannerConfigToJson();
    EXPECT_NE(json.find("\"profile\": \"s_curve\""), std::string::npos);
    EXPECT_NE(json.find("\"max_jerk\": 8000"), std::string::npos);
}

TEST(ConfigManager, SCurveNeedsJerkLimits) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.loadFromString(VALID_CONFIG));

    // Valid limits otherwise, but no max_jerk for an S-curve profile
    EXPECT_FALSE(manager.loadFromString(R"(
planner:
  profile: s_curve
  axes:
    - {name: x, max_velocity: 1, max_acceleration: 1}
    - {name: y, max_velocity: 1, max_acceleration: 1}
    - {name: z, max_velocity: 1, max_acceleration: 1}
)"));
    EXPECT_FALSE(manager.loadFromString(R"(
planner:
  profile: bang_bang
  axes:
    - {name: x, max_velocity: 1, max_acceleration: 1}
    - {name: y, max_velocity: 1, max_acceleration: 1}
    - {name: z, max_velocity: 1, max_acceleration: 1}
)"));
    EXPECT_EQ(manager.plannerConfig().lookahead, 12u);
    EXPECT_EQ(manager.plannerConfig().profile, "trapezoidal");
}

TEST(ConfigManager, MissingFile) {
    EXPECT_FALSE(ConfigManager::instance().loadPlannerConfig("does/not/exist.yaml"));
}

TEST(ConfigManager, LoadsShippedConfig) {
    // Tests run from the repository root
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.loadPlannerConfig("config/planner_config.yaml"));

    std::string error;
    EXPECT_TRUE(manager.plannerConfig().isValid(error)) << error;
}

TEST(ConfigManager, JsonExport) {
    auto& manager = ConfigManager::instance();
    ASSERT_TRUE(manager.loadFromString(VALID_CONFIG));

    std::string json = manager.plannerConfigToJson();
    EXPECT_NE(json.find("\"lookahead\": 12"), std::string::npos);
    EXPECT_NE(json.find("\"mode\": \"blend\""), std::string::npos);
    EXPECT_NE(json.find("\"max_velocity\": 150"), std::string::npos);
}

TEST(PlannerConfig, ParseNames) {
    trajectory::Axis axis;
    EXPECT_TRUE(parseAxisName("X", axis));
    EXPECT_EQ(axis, trajectory::Axis::X);
    EXPECT_FALSE(parseAxisName("w", axis));

    trajectory::ToleranceType type;
    EXPECT_TRUE(parseToleranceMode("EXACT_STOP", type));
    EXPECT_EQ(type, trajectory::ToleranceType::EXACT_STOP);
    EXPECT_FALSE(parseToleranceMode("round", type));

    trajectory::ProfileType profile;
    EXPECT_TRUE(parseProfileType("S_Curve", profile));
    EXPECT_EQ(profile, trajectory::ProfileType::S_CURVE);
    EXPECT_FALSE(parseProfileType("jerk", profile));
}
