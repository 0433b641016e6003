#pragma once
/**
 * @file core.hpp
 * @brief Main include file for the Motion Planner core
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/trajectory/Segment.hpp"
#include "../../src/trajectory/MotionPlanner.hpp"
#include "../../src/trajectory/MotionEmitter.hpp"
#include "../../src/trajectory/MotionPipeline.hpp"
