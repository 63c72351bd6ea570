/**
 * @file KDLKinematics.cpp
 * @brief KDL-based kinematics implementation
 */

#include "KDLKinematics.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"
#include <kdl/frames.hpp>
#include <kdl/jacobian.hpp>
#include <kdl/jntarray.hpp>

namespace arm_teleop {
namespace kinematics {

namespace {

KDL::Frame toKdlFrame(const Pose& pose) {
    const Matrix3d& R = pose.rotation;
    return KDL::Frame(
        KDL::Rotation(R(0, 0), R(0, 1), R(0, 2),
                      R(1, 0), R(1, 1), R(1, 2),
                      R(2, 0), R(2, 1), R(2, 2)),
        KDL::Vector(pose.position.x(), pose.position.y(), pose.position.z()));
}

} // anonymous namespace

// ============================================================================
// Build one KDL chain per frame
// ============================================================================

KDLKinematics::KDLKinematics(const KinematicModel& model)
    : model_(model)
{
    // URDF: T_joint = Translation(xyz) * RPY(rpy) * Rotation(axis, q)
    //
    // A KDL joint placed at the origin point with its axis rotated into the
    // parent frame, followed by the segment tip F_origin, yields
    //   Frame(Rot(M*axis, q), p) * Frame(I, -p) * F_origin = F_origin * Rot(axis, q)
    // which is exactly the URDF convention.
    chains_.resize(model_.frames().size());

    for (std::size_t f = 0; f < model_.frames().size(); ++f) {
        FrameChain& fc = chains_[f];

        for (std::size_t ji : model_.frames()[f].jointPath) {
            const ModelJoint& j = model_.joints()[ji];
            KDL::Frame f_origin = toKdlFrame(j.origin());
            KDL::Vector axis = f_origin.M * KDL::Vector(j.axis.x(), j.axis.y(), j.axis.z());

            KDL::Joint kdl_joint;
            if (!j.isMovable()) {
                kdl_joint = KDL::Joint(j.name, KDL::Joint::Fixed);
            } else if (j.prismatic) {
                kdl_joint = KDL::Joint(j.name, f_origin.p, axis, KDL::Joint::TransAxis);
                fc.qIndices.push_back(j.qIndex);
            } else {
                kdl_joint = KDL::Joint(j.name, f_origin.p, axis, KDL::Joint::RotAxis);
                fc.qIndices.push_back(j.qIndex);
            }

            fc.chain.addSegment(KDL::Segment(j.childLink, kdl_joint, f_origin));
        }

        fc.fkSolver = std::make_unique<KDL::ChainFkSolverPos_recursive>(fc.chain);
        fc.jacSolver = std::make_unique<KDL::ChainJntToJacSolver>(fc.chain);

        LOG_DEBUG("KDLKinematics: frame '{}' chain has {} segments ({} joints)",
            model_.frames()[f].name, fc.chain.getNrOfSegments(), fc.chain.getNrOfJoints());
    }

    initialized_ = true;

    LOG_INFO("KDLKinematics: {} frame chains built, {} DOF", chains_.size(), model_.numDof());
}

// ============================================================================
// Frame lookup
// ============================================================================

bool KDLKinematics::hasFrame(const std::string& frameName) const {
    return model_.findFrame(frameName).has_value();
}

FrameId KDLKinematics::frameId(const std::string& frameName) const {
    auto id = model_.findFrame(frameName);
    if (!id) {
        throw UnknownFrameError(frameName);
    }
    return *id;
}

const KDLKinematics::FrameChain& KDLKinematics::checkedChain(const VectorXd& q, FrameId frame) const {
    if (!initialized_ || frame >= chains_.size()) {
        throw UninitializedFrameError("#" + std::to_string(frame), "no KDL chain for frame id");
    }
    if (!q.allFinite()) {
        throw UninitializedFrameError(model_.frames()[frame].name, "non-finite joint vector");
    }
    return chains_[frame];
}

KDL::JntArray KDLKinematics::toChainJoints(const FrameChain& fc, const VectorXd& q) const {
    VectorXd qc = model_.conform(q);
    KDL::JntArray q_kdl(fc.chain.getNrOfJoints());
    for (std::size_t k = 0; k < fc.qIndices.size(); ++k) {
        q_kdl(k) = qc[fc.qIndices[k]];
    }
    return q_kdl;
}

// ============================================================================
// FK
// ============================================================================

Pose KDLKinematics::forwardKinematics(const VectorXd& q, FrameId frame) const {
    const FrameChain& fc = checkedChain(q, frame);
    if (fc.chain.getNrOfSegments() == 0) {
        return Pose::identity();
    }

    KDL::Frame result;
    int ret = fc.fkSolver->JntToCart(toChainJoints(fc, q), result);
    if (ret < 0) {
        LOG_WARN("KDLKinematics: FK failed with error {}", ret);
        throw UninitializedFrameError(model_.frames()[frame].name,
                                      "KDL FK error " + std::to_string(ret));
    }

    return kdlFrameToPose(result);
}

// ============================================================================
// Jacobian
// ============================================================================

Jacobian KDLKinematics::jacobian(const VectorXd& q, FrameId frame, ReferenceFrame reference) const {
    const FrameChain& fc = checkedChain(q, frame);
    Jacobian J = Jacobian::Zero(6, model_.numDof());
    if (fc.chain.getNrOfJoints() == 0) {
        return J;
    }

    // KDL: reference point at the chain tip, expressed in the base frame
    KDL::Jacobian jac(fc.chain.getNrOfJoints());
    int ret = fc.jacSolver->JntToJac(toChainJoints(fc, q), jac);
    if (ret < 0) {
        LOG_WARN("KDLKinematics: Jacobian failed with error {}", ret);
        throw UninitializedFrameError(model_.frames()[frame].name,
                                      "KDL Jacobian error " + std::to_string(ret));
    }

    for (std::size_t k = 0; k < fc.qIndices.size(); ++k) {
        J.col(fc.qIndices[k]) = jac.data.col(k);
    }

    if (reference == ReferenceFrame::LOCAL) {
        return toLocal(J, forwardKinematics(q, frame).rotation);
    }
    return J;
}

// ============================================================================
// Conversion
// ============================================================================

Pose KDLKinematics::kdlFrameToPose(const KDL::Frame& frame) {
    Pose pose;
    pose.position = Vector3d(frame.p.x(), frame.p.y(), frame.p.z());
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            pose.rotation(i, j) = frame.M(i, j);
        }
    }
    return pose;
}

} // namespace kinematics
} // namespace arm_teleop
