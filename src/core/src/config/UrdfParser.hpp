/**
 * @file UrdfParser.hpp
 * @brief Minimal URDF parser for the arm's kinematic description
 *
 * Extracts what the kinematics providers need:
 * - Links
 * - Joint origins (xyz, rpy) and axes
 * - Joint limits
 * - Base link and base-to-tip order of movable joints
 *
 * Note: simplified parser; only ${radians(x)} xacro expressions are
 * expanded. Convert full xacro files to URDF first.
 */

#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>

namespace arm_teleop {
namespace config {

/**
 * Parsed joint data from URDF (meters, radians)
 */
struct UrdfJoint {
    std::string name;
    std::string type = "revolute";  // revolute, continuous, prismatic, fixed
    std::string parent_link;
    std::string child_link;

    std::array<double, 3> origin_xyz = {0, 0, 0};
    std::array<double, 3> origin_rpy = {0, 0, 0};

    std::array<double, 3> axis = {1, 0, 0};  // URDF default

    double limit_lower = -3.14159;
    double limit_upper = 3.14159;
    double limit_velocity = 1.0;
    double limit_effort = 0;

    bool isMovable() const { return type != "fixed"; }
};

struct UrdfLink {
    std::string name;
};

/**
 * Complete parsed URDF model
 */
struct UrdfModel {
    std::string name;
    std::vector<UrdfLink> links;
    std::vector<UrdfJoint> joints;

    // Derived data
    std::string base_link_name;
    std::vector<std::string> joint_order;  // Movable joints, base to tip

    const UrdfJoint* findJoint(const std::string& joint_name) const;
    const UrdfJoint* jointWithChild(const std::string& link_name) const;
    bool hasLink(const std::string& link_name) const;
};

/**
 * Result of URDF parsing
 */
struct UrdfParseResult {
    bool success = false;
    std::string error;
    UrdfModel model;
};

/**
 * URDF Parser class
 *
 * Usage:
 *   UrdfParser parser;
 *   auto result = parser.parseFile("models/so101.urdf");
 *   if (result.success) {
 *       // Use result.model
 *   }
 */
class UrdfParser {
public:
    UrdfParser() = default;

    UrdfParseResult parseFile(const std::filesystem::path& filepath);

    UrdfParseResult parseString(const std::string& xml_content);

private:
    void parseTriple(const std::string& str, std::array<double, 3>& out);

    void parseLimit(const std::string& lower, const std::string& upper,
                    const std::string& velocity, const std::string& effort,
                    UrdfJoint& joint);

    /**
     * Expand ${radians(x)} or a plain number
     * @throws std::runtime_error on anything else
     */
    double expandXacroExpression(const std::string& expr);

    void orderJoints(UrdfModel& model);

    /**
     * Find base link (link that is no joint's child)
     */
    std::string findBaseLink(const UrdfModel& model);
};

} // namespace config
} // namespace arm_teleop
