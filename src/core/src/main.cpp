/**
 * @file main.cpp
 * @brief Motion Planner demo - plans a short program and prints setpoints as CSV
 */

#include <iostream>
#include <vector>

#include "logging/Logger.hpp"
#include "config/ConfigManager.hpp"
#include "trajectory/MotionPipeline.hpp"

using namespace motion_planner;
using namespace motion_planner::config;
using namespace motion_planner::trajectory;

namespace {

// Square with one rounded corner and a colinear split, 2 mm above the table
std::vector<Segment> demoProgram() {
    const double z = 2.0;
    std::vector<Segment> program;
    program.push_back(Segment::line(Vector3d(0, 0, z), Vector3d(20, 0, z)));
    program.push_back(Segment::line(Vector3d(20, 0, z), Vector3d(40, 0, z)));
    program.push_back(Segment::arcFromCenter(Vector3d(40, 0, z), Vector3d(50, 10, z),
                                             Vector3d(40, 10, z), Vector3d::UnitZ(),
                                             ArcDirection::COUNTER_CLOCKWISE));
    program.push_back(Segment::line(Vector3d(50, 10, z), Vector3d(50, 40, z)));
    program.push_back(Segment::line(Vector3d(50, 40, z), Vector3d(0, 40, z)));
    program.push_back(Segment::line(Vector3d(0, 40, z), Vector3d(0, 0, z)));
    return program;
}

} // namespace

int main(int argc, char* argv[]) {
    // Determine config directory (from arg)
    std::string config_dir = "config";
    if (argc > 1) {
        config_dir = argv[1];
    }

    // Console output is reserved for the CSV stream until the config is known
    LoggingConfig bootLogging;
    bootLogging.console_enabled = false;
    Logger::init(bootLogging);

    auto& config = ConfigManager::instance();
    if (!config.loadPlannerConfig(config_dir + "/planner_config.yaml")) {
        std::cerr << "Failed to load " << config_dir << "/planner_config.yaml" << std::endl;
        return 1;
    }

    const PlannerConfig& plannerConfig = config.plannerConfig();
    LoggingConfig logging = plannerConfig.logging;
    logging.console_enabled = false;
    Logger::init(logging);

    LOG_INFO("Motion planner demo, config: {}", config.plannerConfigToJson());

    PipelineConfig pipelineConfig;
    pipelineConfig.context = plannerConfig.toPlanningContext();
    pipelineConfig.tickPeriod = plannerConfig.tickPeriod();
    pipelineConfig.bufferHorizon = plannerConfig.emitter.buffer_horizon_s;
    pipelineConfig.queueCapacity = plannerConfig.queue_capacity;

    MotionPipeline pipeline(pipelineConfig);
    if (!pipeline.isConfigured()) {
        std::cerr << "Planner configuration rejected, see log" << std::endl;
        return 1;
    }

    std::vector<Segment> program = demoProgram();
    pipeline.setPosition(program.front().startPoint());
    for (const auto& segment : program) {
        PushResult pushed = pipeline.push(segment);
        if (!pushed.success) {
            std::cerr << "Segment rejected (" << plannerErrorToString(pushed.error)
                      << "): " << pushed.message << std::endl;
            return 1;
        }
    }

    PlanResult flushed = pipeline.flush();
    if (!flushed.success) {
        std::cerr << "Planning failed (" << plannerErrorToString(flushed.error)
                  << "): " << flushed.message << std::endl;
        return 1;
    }

    std::cout << "t,x,y,z,vx,vy,vz,ax,ay,az,v,segment" << std::endl;
    size_t ticks = 0;
    while (!pipeline.isIdle()) {
        AxisSetpoint sp = pipeline.tick();
        if (!sp.moving) continue;
        ++ticks;
        std::cout << sp.time << ','
                  << sp.position.x() << ',' << sp.position.y() << ',' << sp.position.z() << ','
                  << sp.velocity.x() << ',' << sp.velocity.y() << ',' << sp.velocity.z() << ','
                  << sp.acceleration.x() << ',' << sp.acceleration.y() << ','
                  << sp.acceleration.z() << ',' << sp.pathVelocity << ','
                  << sp.segmentId << '\n';
    }

    LOG_INFO("Demo finished: {} setpoints", ticks);
    return 0;
}
