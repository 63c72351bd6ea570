/**
 * @file UrdfChainKinematics.hpp
 * @brief URDF-convention forward kinematics and analytic Jacobian (Eigen only)
 *
 * URDF FK formula per joint:
 *   T_joint = Translation(xyz) * RPY(rpy) * Rotation(axis, q)
 */

#pragma once

#include "IKinematicsProvider.hpp"
#include <vector>

namespace arm_teleop {
namespace kinematics {

class UrdfChainKinematics : public IKinematicsProvider {
public:
    explicit UrdfChainKinematics(const KinematicModel& model);

    std::string name() const override { return "urdf"; }

    int numJoints() const override { return model_.numDof(); }
    std::vector<std::string> jointNames() const override { return model_.movableJointNames(); }
    std::vector<std::pair<double, double>> jointLimits() const override { return model_.jointLimits(); }

    bool hasFrame(const std::string& frameName) const override;
    FrameId frameId(const std::string& frameName) const override;

    Pose forwardKinematics(const VectorXd& q, FrameId frame) const override;
    Jacobian jacobian(const VectorXd& q, FrameId frame, ReferenceFrame reference) const override;

    /**
     * Placement of every joint frame on the path to `frame`, after the
     * joint motion (last entry is the frame itself)
     */
    std::vector<Pose> computeChainTransforms(const VectorXd& q, FrameId frame) const;

    const KinematicModel& model() const { return model_; }

private:
    VectorXd checkedJoints(const VectorXd& q, FrameId frame) const;

    KinematicModel model_;
};

} // namespace kinematics
} // namespace arm_teleop
