/**
 * @file TeleopConfig.hpp
 * @brief Teleoperation configuration data structures
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arm_teleop {
namespace config {

/**
 * Kinematic model source
 */
struct ModelConfig {
    std::string urdf = "models/so101.urdf";
    std::string frame = "gripper_link";
    std::string backend = "kdl";          // kdl | urdf
};

/**
 * Control loop configuration
 */
struct ControlConfig {
    int cycle_time_ms = 100;
    std::string mode = "joystick";        // joystick | leader
    int io_timeout_ms = 50;
    int max_consecutive_faults = 3;
};

struct IkConfig {
    double tolerance = 1e-3;
    int max_iterations = 10;
    double damping = 1e-4;
};

struct IntegratorSettings {
    double translation_speed = 0.01;      // m per cycle
    double rotation_speed_deg = 1.0;      // deg per cycle
    double deadzone = 0.1;
};

/**
 * Safety configuration
 */
struct SafetyConfig {
    double max_joint_step_rad = 0.5;
    bool halt_on_non_convergence = false;
    bool hold_last_safe_on_halt = true;
};

struct GripperConfig {
    bool from_controller_axis = true;
};

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/teleop.log";
    int max_size_mb = 10;
    int max_files = 5;
};

/**
 * Stand-in arm used when no hardware transport is attached
 */
struct SimulationConfig {
    std::map<std::string, double> initial_observation = {
        {"shoulder_pan.pos", 0.0},
        {"shoulder_lift.pos", 0.0},
        {"elbow_flex.pos", 0.0},
        {"wrist_flex.pos", 0.0},
        {"wrist_roll.pos", 0.0},
        {"gripper.pos", 100.0},
    };
};

/**
 * Complete teleoperation configuration
 */
struct TeleopConfig {
    ModelConfig model;
    ControlConfig control;
    IkConfig ik;
    IntegratorSettings integrator;
    SafetyConfig safety;
    GripperConfig gripper;
    std::optional<double> led_intensity;
    LoggingConfig logging;
    SimulationConfig simulation;

    /**
     * @return one message per invalid value, empty when valid
     */
    std::vector<std::string> validate() const;
};

} // namespace config
} // namespace arm_teleop
