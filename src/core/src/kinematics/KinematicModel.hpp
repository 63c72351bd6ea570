/**
 * @file KinematicModel.hpp
 * @brief Joint tree and frame paths derived from a parsed URDF model
 *
 * Shared by both kinematics providers so they agree on joint ordering,
 * limits and frame ids.
 */

#pragma once

#include "MathTypes.hpp"
#include "../config/UrdfParser.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arm_teleop {
namespace kinematics {

using FrameId = std::size_t;

/**
 * URDF joint in SI units: Trans(xyz) * RPY(rpy) * Motion(axis, q)
 */
struct ModelJoint {
    std::string name;
    std::string parentLink;
    std::string childLink;
    Vector3d originXyz = Vector3d::Zero();   // m
    Vector3d originRpy = Vector3d::Zero();   // rad
    Vector3d axis = Vector3d::UnitZ();       // unit vector, joint frame
    double lower = -PI;
    double upper = PI;
    bool revolute = true;
    bool prismatic = false;
    int qIndex = -1;                         // -1 for fixed joints

    bool isMovable() const { return qIndex >= 0; }
    Pose origin() const { return Pose(originXyz, rpyToRotation(originRpy)); }

    /**
     * Origin transform followed by the joint motion
     */
    Pose transform(double q) const;
};

/**
 * Every link is a frame; its path lists joint indices from the base
 */
struct ModelFrame {
    std::string name;
    std::vector<std::size_t> jointPath;
};

class KinematicModel {
public:
    KinematicModel() = default;

    /**
     * @throws std::invalid_argument if the link tree is malformed
     */
    static KinematicModel fromUrdf(const config::UrdfModel& urdf);

    const std::string& name() const { return m_name; }
    const std::string& baseLink() const { return m_baseLink; }

    const std::vector<ModelJoint>& joints() const { return m_joints; }
    const std::vector<ModelFrame>& frames() const { return m_frames; }

    int numDof() const { return m_numDof; }
    std::vector<std::string> movableJointNames() const;
    std::vector<std::pair<double, double>> jointLimits() const;

    std::optional<FrameId> findFrame(const std::string& frameName) const;
    bool validFrame(FrameId id) const { return id < m_frames.size(); }

    /**
     * Pad with zeros or truncate to numDof()
     */
    VectorXd conform(const VectorXd& q) const;

private:
    std::string m_name;
    std::string m_baseLink;
    std::vector<ModelJoint> m_joints;
    std::vector<ModelFrame> m_frames;
    int m_numDof = 0;
};

} // namespace kinematics
} // namespace arm_teleop
