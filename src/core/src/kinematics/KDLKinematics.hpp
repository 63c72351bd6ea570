/**
 * @file KDLKinematics.hpp
 * @brief Orocos KDL kinematics provider
 *
 * One KDL chain per model frame (base link to that frame), built from the
 * same KinematicModel as UrdfChainKinematics so both providers can be
 * cross-validated.
 */

#pragma once

#include "IKinematicsProvider.hpp"
#include <kdl/chain.hpp>
#include <kdl/chainfksolverpos_recursive.hpp>
#include <kdl/chainjnttojacsolver.hpp>
#include <memory>
#include <vector>

namespace arm_teleop {
namespace kinematics {

class KDLKinematics : public IKinematicsProvider {
public:
    explicit KDLKinematics(const KinematicModel& model);
    ~KDLKinematics() override = default;

    std::string name() const override { return "kdl"; }

    int numJoints() const override { return model_.numDof(); }
    std::vector<std::string> jointNames() const override { return model_.movableJointNames(); }
    std::vector<std::pair<double, double>> jointLimits() const override { return model_.jointLimits(); }

    bool hasFrame(const std::string& frameName) const override;
    FrameId frameId(const std::string& frameName) const override;

    Pose forwardKinematics(const VectorXd& q, FrameId frame) const override;
    Jacobian jacobian(const VectorXd& q, FrameId frame, ReferenceFrame reference) const override;

    bool isInitialized() const { return initialized_; }

private:
    struct FrameChain {
        KDL::Chain chain;
        std::vector<int> qIndices;   // chain joint k -> model joint index
        std::unique_ptr<KDL::ChainFkSolverPos_recursive> fkSolver;
        std::unique_ptr<KDL::ChainJntToJacSolver> jacSolver;
    };

    const FrameChain& checkedChain(const VectorXd& q, FrameId frame) const;
    KDL::JntArray toChainJoints(const FrameChain& fc, const VectorXd& q) const;

    static Pose kdlFrameToPose(const KDL::Frame& frame);

    KinematicModel model_;
    std::vector<FrameChain> chains_;
    bool initialized_ = false;
};

} // namespace kinematics
} // namespace arm_teleop
