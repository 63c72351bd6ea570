/**
 * @file main.cpp
 * @brief Arm teleoperation core - entry point
 *
 * Reads controller axes (or leader-arm observations) as JSON lines on stdin
 * and writes governed joint commands as JSON lines on stdout. The follower
 * arm is the simulated loopback arm; logs go to stderr and the log file.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <signal.h>
#include <unistd.h>

#include "config/ConfigManager.hpp"
#include "config/UrdfParser.hpp"
#include "control/ControlLoop.hpp"
#include "io/JsonLinesIO.hpp"
#include "io/SimulatedArm.hpp"
#include "kinematics/KDLKinematics.hpp"
#include "kinematics/UrdfChainKinematics.hpp"
#include "logging/Logger.hpp"

using namespace arm_teleop;
using namespace arm_teleop::config;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

// No SA_RESTART: a signal must wake the stdin wait
bool installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    return sigaction(SIGINT, &action, nullptr) == 0
        && sigaction(SIGTERM, &action, nullptr) == 0;
}

int main(int argc, char* argv[]) {
    // cin keeps its own buffer, so in_avail() reflects unread lines
    std::ios::sync_with_stdio(false);

    std::string config_path = "config/teleop_config.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    // Basic setup, reconfigured after loading config
    Logger::init("logs/teleop.log", "info");

    if (!installSignalHandlers()) {
        LOG_ERROR("Failed to install signal handlers");
        return 1;
    }

    LOG_INFO("========================================");
    LOG_INFO("Arm Teleop Core v1.0.0");
    LOG_INFO("========================================");
    LOG_INFO("Config file: {}", config_path);

    auto& config = ConfigManager::instance();
    if (!config.loadFile(config_path)) {
        LOG_ERROR("Failed to load configuration file: {}", config_path);
        return 1;
    }
    const TeleopConfig& cfg = config.teleopConfig();

    Logger::init(
        cfg.logging.file,
        cfg.logging.level,
        static_cast<size_t>(cfg.logging.max_size_mb) * 1024 * 1024,
        static_cast<size_t>(cfg.logging.max_files)
    );
    LOG_DEBUG("Effective config: {}", config.teleopConfigToJson());

    // Kinematic model
    UrdfParser parser;
    auto parsed = parser.parseFile(cfg.model.urdf);
    if (!parsed.success) {
        LOG_ERROR("Failed to load robot model {}: {}", cfg.model.urdf, parsed.error);
        return 1;
    }

    std::unique_ptr<kinematics::IKinematicsProvider> provider;
    try {
        auto model = kinematics::KinematicModel::fromUrdf(parsed.model);
        if (cfg.model.backend == "urdf") {
            provider = std::make_unique<kinematics::UrdfChainKinematics>(model);
        } else {
            provider = std::make_unique<kinematics::KDLKinematics>(model);
        }
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid kinematic model: {}", e.what());
        return 1;
    }

    // Boundaries
    io::SimulatedArm follower(cfg.simulation.initial_observation);
    io::JsonLinesCommandSink sink(std::cout);

    const std::chrono::milliseconds wait(cfg.control.io_timeout_ms);
    std::unique_ptr<io::JsonLinesControllerInput> controller;
    std::unique_ptr<io::JsonLinesJointStateSource> leader;
    if (cfg.control.mode == "leader") {
        leader = std::make_unique<io::JsonLinesJointStateSource>(std::cin, STDIN_FILENO, wait);
    } else {
        controller = std::make_unique<io::JsonLinesControllerInput>(std::cin, STDIN_FILENO, wait);
    }

    control::ControlLoop loop(cfg, *provider, follower, sink, controller.get(), leader.get());
    loop.run(g_running);

    LOG_INFO("Shutdown complete: {} ({})",
             state::toString(loop.haltReason()), loop.haltDetail());
    spdlog::shutdown();

    switch (loop.haltReason()) {
        case state::FaultCode::INTERRUPTED:
        case state::FaultCode::END_OF_INPUT:
            return 0;
        default:
            return 2;
    }
}
