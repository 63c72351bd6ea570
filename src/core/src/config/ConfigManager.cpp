/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace arm_teleop {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFile(const std::string& filepath) {
    if (!fs::exists(filepath)) {
        LOG_ERROR("Teleop config file not found: {}", filepath);
        return false;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open teleop config file: {}", filepath);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_INFO("Loading teleop config from: {}", filepath);
    return parse(buffer.str(), fs::path(filepath).parent_path().string(), filepath);
}

bool ConfigManager::loadString(const std::string& yaml_content) {
    return parse(yaml_content, "", "<string>");
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = TeleopConfig{};
    m_loaded = false;
}

bool ConfigManager::parse(const std::string& yaml_content, const std::string& base_dir,
                          const std::string& origin) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        YAML::Node root = YAML::Load(yaml_content);
        YAML::Node teleop = root["teleop"];

        if (!teleop) {
            LOG_ERROR("Missing 'teleop' section in config {}", origin);
            return false;
        }

        TeleopConfig cfg;

        // Model
        if (teleop["model"]) {
            auto model = teleop["model"];
            cfg.model.urdf = model["urdf"].as<std::string>(cfg.model.urdf);
            cfg.model.frame = model["frame"].as<std::string>(cfg.model.frame);
            cfg.model.backend = model["backend"].as<std::string>(cfg.model.backend);
        }
        if (!base_dir.empty() && fs::path(cfg.model.urdf).is_relative()) {
            cfg.model.urdf = (fs::path(base_dir) / cfg.model.urdf).lexically_normal().string();
        }

        // Control loop
        if (teleop["control"]) {
            auto control = teleop["control"];
            cfg.control.cycle_time_ms = control["cycle_time_ms"].as<int>(cfg.control.cycle_time_ms);
            cfg.control.mode = control["mode"].as<std::string>(cfg.control.mode);
            cfg.control.io_timeout_ms = control["io_timeout_ms"].as<int>(cfg.control.io_timeout_ms);
            cfg.control.max_consecutive_faults =
                control["max_consecutive_faults"].as<int>(cfg.control.max_consecutive_faults);
        }

        // IK
        if (teleop["ik"]) {
            auto ik = teleop["ik"];
            cfg.ik.tolerance = ik["tolerance"].as<double>(cfg.ik.tolerance);
            cfg.ik.max_iterations = ik["max_iterations"].as<int>(cfg.ik.max_iterations);
            cfg.ik.damping = ik["damping"].as<double>(cfg.ik.damping);
        }

        // Pose integrator
        if (teleop["integrator"]) {
            auto integrator = teleop["integrator"];
            cfg.integrator.translation_speed =
                integrator["translation_speed"].as<double>(cfg.integrator.translation_speed);
            cfg.integrator.rotation_speed_deg =
                integrator["rotation_speed_deg"].as<double>(cfg.integrator.rotation_speed_deg);
            cfg.integrator.deadzone = integrator["deadzone"].as<double>(cfg.integrator.deadzone);
        }

        // Safety
        if (teleop["safety"]) {
            auto safety = teleop["safety"];
            cfg.safety.max_joint_step_rad =
                safety["max_joint_step_rad"].as<double>(cfg.safety.max_joint_step_rad);
            cfg.safety.halt_on_non_convergence =
                safety["halt_on_non_convergence"].as<bool>(cfg.safety.halt_on_non_convergence);
            cfg.safety.hold_last_safe_on_halt =
                safety["hold_last_safe_on_halt"].as<bool>(cfg.safety.hold_last_safe_on_halt);
        }

        if (teleop["gripper"]) {
            cfg.gripper.from_controller_axis =
                teleop["gripper"]["from_controller_axis"].as<bool>(cfg.gripper.from_controller_axis);
        }

        if (teleop["led"] && teleop["led"]["intensity"]) {
            cfg.led_intensity = teleop["led"]["intensity"].as<double>();
        }

        // Logging
        if (teleop["logging"]) {
            auto logging = teleop["logging"];
            cfg.logging.level = logging["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = logging["file"].as<std::string>(cfg.logging.file);
            cfg.logging.max_size_mb = logging["max_size_mb"].as<int>(cfg.logging.max_size_mb);
            cfg.logging.max_files = logging["max_files"].as<int>(cfg.logging.max_files);
        }

        // Simulation
        if (teleop["simulation"] && teleop["simulation"]["initial_observation"]) {
            cfg.simulation.initial_observation.clear();
            for (const auto& entry : teleop["simulation"]["initial_observation"]) {
                cfg.simulation.initial_observation[entry.first.as<std::string>()] =
                    entry.second.as<double>();
            }
        }

        auto errors = cfg.validate();
        if (!errors.empty()) {
            for (const auto& e : errors) {
                LOG_ERROR("Teleop config {}: {}", origin, e);
            }
            return false;
        }

        m_config = cfg;
        m_loaded = true;
        LOG_INFO("Teleop config loaded: backend {}, frame {}, mode {}, cycle {} ms",
                 m_config.model.backend, m_config.model.frame,
                 m_config.control.mode, m_config.control.cycle_time_ms);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in teleop config {}: {}", origin, e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading teleop config {}: {}", origin, e.what());
        return false;
    }
}

std::string ConfigManager::teleopConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["model"] = {
        {"urdf", m_config.model.urdf},
        {"frame", m_config.model.frame},
        {"backend", m_config.model.backend}
    };
    j["control"] = {
        {"cycle_time_ms", m_config.control.cycle_time_ms},
        {"mode", m_config.control.mode},
        {"io_timeout_ms", m_config.control.io_timeout_ms},
        {"max_consecutive_faults", m_config.control.max_consecutive_faults}
    };
    j["ik"] = {
        {"tolerance", m_config.ik.tolerance},
        {"max_iterations", m_config.ik.max_iterations},
        {"damping", m_config.ik.damping}
    };
    j["integrator"] = {
        {"translation_speed", m_config.integrator.translation_speed},
        {"rotation_speed_deg", m_config.integrator.rotation_speed_deg},
        {"deadzone", m_config.integrator.deadzone}
    };
    j["safety"] = {
        {"max_joint_step_rad", m_config.safety.max_joint_step_rad},
        {"halt_on_non_convergence", m_config.safety.halt_on_non_convergence},
        {"hold_last_safe_on_halt", m_config.safety.hold_last_safe_on_halt}
    };
    j["gripper"] = {{"from_controller_axis", m_config.gripper.from_controller_axis}};
    if (m_config.led_intensity) {
        j["led"] = {{"intensity", *m_config.led_intensity}};
    }

    return j.dump();
}

} // namespace config
} // namespace arm_teleop
