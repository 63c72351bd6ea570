/**
 * @file JointTypes.hpp
 * @brief Joint identifiers and joint-space containers
 */

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>

namespace arm_teleop {
namespace joints {

/**
 * Fixed joint ordering of the arm (index-aligned with JointVector)
 */
enum class JointId : uint8_t {
    SHOULDER_PAN = 0,
    SHOULDER_LIFT,
    ELBOW_FLEX,
    WRIST_FLEX,
    WRIST_ROLL,
    GRIPPER
};

constexpr int NUM_JOINTS = 6;

constexpr std::array<JointId, NUM_JOINTS> ALL_JOINTS = {
    JointId::SHOULDER_PAN, JointId::SHOULDER_LIFT, JointId::ELBOW_FLEX,
    JointId::WRIST_FLEX, JointId::WRIST_ROLL, JointId::GRIPPER
};

// Joint values in either domain (normalized or radians), indexed by JointId
using JointVector = std::array<double, NUM_JOINTS>;

// Device-facing "<joint>.pos" / "<channel>.intensity" maps
using JointValueMap = std::map<std::string, double>;

constexpr double NORMALIZED_MIN = -100.0;
constexpr double NORMALIZED_MAX = 100.0;

constexpr const char* POSITION_SUFFIX = ".pos";
constexpr const char* INTENSITY_SUFFIX = ".intensity";
constexpr const char* LED_CHANNEL = "led.intensity";

inline constexpr int index(JointId id) {
    return static_cast<int>(id);
}

inline std::string toString(JointId id) {
    switch (id) {
        case JointId::SHOULDER_PAN:  return "shoulder_pan";
        case JointId::SHOULDER_LIFT: return "shoulder_lift";
        case JointId::ELBOW_FLEX:    return "elbow_flex";
        case JointId::WRIST_FLEX:    return "wrist_flex";
        case JointId::WRIST_ROLL:    return "wrist_roll";
        case JointId::GRIPPER:       return "gripper";
        default:                     return "unknown";
    }
}

} // namespace joints
} // namespace arm_teleop
