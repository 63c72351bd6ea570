/**
 * @file UrdfChainKinematics.cpp
 * @brief URDF chain kinematics implementation
 */

#include "UrdfChainKinematics.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"

namespace arm_teleop {
namespace kinematics {

// ============================================================================
// Constructor
// ============================================================================

UrdfChainKinematics::UrdfChainKinematics(const KinematicModel& model)
    : model_(model)
{
    LOG_INFO("UrdfChainKinematics created with {} joints, {} frames",
        model_.numDof(), model_.frames().size());

    for (const auto& j : model_.joints()) {
        LOG_DEBUG("  Joint '{}' [q{}]: xyz=({},{},{}), rpy=({},{},{}), axis=({},{},{})",
            j.name, j.qIndex,
            j.originXyz.x(), j.originXyz.y(), j.originXyz.z(),
            j.originRpy.x(), j.originRpy.y(), j.originRpy.z(),
            j.axis.x(), j.axis.y(), j.axis.z());
    }
}

// ============================================================================
// Frame lookup
// ============================================================================

bool UrdfChainKinematics::hasFrame(const std::string& frameName) const {
    return model_.findFrame(frameName).has_value();
}

FrameId UrdfChainKinematics::frameId(const std::string& frameName) const {
    auto id = model_.findFrame(frameName);
    if (!id) {
        throw UnknownFrameError(frameName);
    }
    return *id;
}

VectorXd UrdfChainKinematics::checkedJoints(const VectorXd& q, FrameId frame) const {
    if (!model_.validFrame(frame)) {
        throw UninitializedFrameError("#" + std::to_string(frame), "frame id not in model");
    }
    VectorXd qc = model_.conform(q);
    if (!qc.allFinite()) {
        throw UninitializedFrameError(model_.frames()[frame].name, "non-finite joint vector");
    }
    return qc;
}

// ============================================================================
// Forward kinematics
// ============================================================================

std::vector<Pose> UrdfChainKinematics::computeChainTransforms(const VectorXd& q, FrameId frame) const {
    VectorXd qc = checkedJoints(q, frame);

    const auto& path = model_.frames()[frame].jointPath;
    std::vector<Pose> transforms;
    transforms.reserve(path.size());

    Pose T;
    for (std::size_t ji : path) {
        const ModelJoint& j = model_.joints()[ji];
        T = T * j.transform(j.isMovable() ? qc[j.qIndex] : 0.0);
        transforms.push_back(T);
    }
    return transforms;
}

Pose UrdfChainKinematics::forwardKinematics(const VectorXd& q, FrameId frame) const {
    auto transforms = computeChainTransforms(q, frame);
    if (transforms.empty()) {
        return Pose::identity();
    }
    return transforms.back();
}

// ============================================================================
// Analytic geometric Jacobian
// ============================================================================

Jacobian UrdfChainKinematics::jacobian(const VectorXd& q, FrameId frame, ReferenceFrame reference) const {
    auto transforms = computeChainTransforms(q, frame);
    Jacobian J = Jacobian::Zero(6, model_.numDof());
    if (transforms.empty()) {
        return J;
    }

    const auto& path = model_.frames()[frame].jointPath;
    const Vector3d pEnd = transforms.back().position;

    for (std::size_t k = 0; k < path.size(); ++k) {
        const ModelJoint& j = model_.joints()[path[k]];
        if (!j.isMovable()) continue;

        // Axis does not change under motion about itself, so the post-motion
        // joint frame gives the world axis and origin
        const Vector3d axisWorld = transforms[k].rotation * j.axis;
        const Vector3d pJoint = transforms[k].position;

        if (j.prismatic) {
            J.block<3, 1>(0, j.qIndex) = axisWorld;
        } else {
            J.block<3, 1>(0, j.qIndex) = axisWorld.cross(pEnd - pJoint);
            J.block<3, 1>(3, j.qIndex) = axisWorld;
        }
    }

    if (reference == ReferenceFrame::LOCAL) {
        return toLocal(J, transforms.back().rotation);
    }
    return J;
}

} // namespace kinematics
} // namespace arm_teleop
