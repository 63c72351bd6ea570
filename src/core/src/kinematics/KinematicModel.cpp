/**
 * @file KinematicModel.cpp
 * @brief Kinematic model construction from URDF data
 */

#include "KinematicModel.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace arm_teleop {
namespace kinematics {

Pose ModelJoint::transform(double q) const {
    Pose T = origin();
    if (!isMovable() || q == 0.0) {
        return T;
    }
    if (prismatic) {
        return T * Pose(axis * q, Matrix3d::Identity());
    }
    return T * Pose(Vector3d::Zero(), AngleAxisd(q, axis).toRotationMatrix());
}

KinematicModel KinematicModel::fromUrdf(const config::UrdfModel& urdf) {
    KinematicModel model;
    model.m_name = urdf.name;
    model.m_baseLink = urdf.base_link_name;

    std::map<std::string, std::size_t> jointByChild;

    for (const auto& uj : urdf.joints) {
        ModelJoint j;
        j.name = uj.name;
        j.parentLink = uj.parent_link;
        j.childLink = uj.child_link;
        j.originXyz = Vector3d(uj.origin_xyz[0], uj.origin_xyz[1], uj.origin_xyz[2]);
        j.originRpy = Vector3d(uj.origin_rpy[0], uj.origin_rpy[1], uj.origin_rpy[2]);
        j.axis = Vector3d(uj.axis[0], uj.axis[1], uj.axis[2]);
        j.lower = uj.limit_lower;
        j.upper = uj.limit_upper;
        j.prismatic = (uj.type == "prismatic");
        j.revolute = (uj.type == "revolute" || uj.type == "continuous");

        if (uj.isMovable() && !j.revolute && !j.prismatic) {
            throw std::invalid_argument("Unsupported joint type '" + uj.type + "' for " + uj.name);
        }
        if (jointByChild.count(j.childLink) != 0) {
            throw std::invalid_argument("Link '" + j.childLink + "' has more than one parent joint");
        }
        jointByChild[j.childLink] = model.m_joints.size();
        model.m_joints.push_back(j);
    }

    // Movable joints on the main chain come first, in base-to-tip order
    int next = 0;
    for (const auto& name : urdf.joint_order) {
        for (auto& j : model.m_joints) {
            if (j.name == name && j.qIndex < 0) {
                j.qIndex = next++;
            }
        }
    }
    for (std::size_t i = 0; i < urdf.joints.size(); ++i) {
        if (urdf.joints[i].isMovable() && model.m_joints[i].qIndex < 0) {
            model.m_joints[i].qIndex = next++;
        }
    }
    model.m_numDof = next;

    for (const auto& link : urdf.links) {
        ModelFrame frame;
        frame.name = link.name;

        std::string current = link.name;
        while (current != model.m_baseLink) {
            auto it = jointByChild.find(current);
            if (it == jointByChild.end()) {
                throw std::invalid_argument("Link '" + link.name + "' is not connected to base '"
                                            + model.m_baseLink + "'");
            }
            if (frame.jointPath.size() > model.m_joints.size()) {
                throw std::invalid_argument("Cycle in link tree at '" + current + "'");
            }
            frame.jointPath.push_back(it->second);
            current = model.m_joints[it->second].parentLink;
        }
        std::reverse(frame.jointPath.begin(), frame.jointPath.end());
        model.m_frames.push_back(frame);
    }

    LOG_INFO("Kinematic model '{}': {} frames, {} DOF, base '{}'",
             model.m_name, model.m_frames.size(), model.m_numDof, model.m_baseLink);
    return model;
}

std::vector<std::string> KinematicModel::movableJointNames() const {
    std::vector<std::string> names(m_numDof);
    for (const auto& j : m_joints) {
        if (j.isMovable()) {
            names[j.qIndex] = j.name;
        }
    }
    return names;
}

std::vector<std::pair<double, double>> KinematicModel::jointLimits() const {
    std::vector<std::pair<double, double>> limits(m_numDof);
    for (const auto& j : m_joints) {
        if (j.isMovable()) {
            limits[j.qIndex] = {j.lower, j.upper};
        }
    }
    return limits;
}

std::optional<FrameId> KinematicModel::findFrame(const std::string& frameName) const {
    for (std::size_t i = 0; i < m_frames.size(); ++i) {
        if (m_frames[i].name == frameName) {
            return i;
        }
    }
    return std::nullopt;
}

VectorXd KinematicModel::conform(const VectorXd& q) const {
    VectorXd out = VectorXd::Zero(m_numDof);
    const Eigen::Index n = std::min<Eigen::Index>(q.size(), m_numDof);
    out.head(n) = q.head(n);
    return out;
}

} // namespace kinematics
} // namespace arm_teleop
