/**
 * @file TeleopConfig.cpp
 * @brief Teleoperation configuration validation
 */

#include "TeleopConfig.hpp"

namespace arm_teleop {
namespace config {

std::vector<std::string> TeleopConfig::validate() const {
    std::vector<std::string> errors;

    if (model.urdf.empty()) {
        errors.push_back("model.urdf must not be empty");
    }
    if (model.frame.empty()) {
        errors.push_back("model.frame must not be empty");
    }
    if (model.backend != "kdl" && model.backend != "urdf") {
        errors.push_back("model.backend must be 'kdl' or 'urdf', got '" + model.backend + "'");
    }

    if (control.cycle_time_ms <= 0) {
        errors.push_back("control.cycle_time_ms must be positive");
    }
    if (control.mode != "joystick" && control.mode != "leader") {
        errors.push_back("control.mode must be 'joystick' or 'leader', got '" + control.mode + "'");
    }
    if (control.io_timeout_ms <= 0) {
        errors.push_back("control.io_timeout_ms must be positive");
    }
    if (control.max_consecutive_faults < 1) {
        errors.push_back("control.max_consecutive_faults must be at least 1");
    }

    if (!(ik.tolerance > 0.0)) {
        errors.push_back("ik.tolerance must be positive");
    }
    if (ik.max_iterations < 1) {
        errors.push_back("ik.max_iterations must be at least 1");
    }
    if (ik.damping < 0.0) {
        errors.push_back("ik.damping must not be negative");
    }

    if (integrator.translation_speed < 0.0) {
        errors.push_back("integrator.translation_speed must not be negative");
    }
    if (integrator.rotation_speed_deg < 0.0) {
        errors.push_back("integrator.rotation_speed_deg must not be negative");
    }
    if (integrator.deadzone < 0.0 || integrator.deadzone >= 1.0) {
        errors.push_back("integrator.deadzone must be in [0, 1)");
    }

    if (!(safety.max_joint_step_rad > 0.0)) {
        errors.push_back("safety.max_joint_step_rad must be positive");
    }

    if (led_intensity && (*led_intensity < 0.0 || *led_intensity > 100.0)) {
        errors.push_back("led.intensity must be in [0, 100]");
    }

    if (logging.max_size_mb <= 0 || logging.max_files <= 0) {
        errors.push_back("logging.max_size_mb and logging.max_files must be positive");
    }

    return errors;
}

} // namespace config
} // namespace arm_teleop
