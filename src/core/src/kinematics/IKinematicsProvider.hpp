/**
 * @file IKinematicsProvider.hpp
 * @brief Abstract kinematics provider (FK, frame Jacobian, model queries)
 *
 * Implementations:
 * - UrdfChainKinematics: Eigen-only URDF chain with analytic Jacobian
 * - KDLKinematics: Orocos KDL chain solvers
 *
 * Joint vectors shorter than numJoints() are zero-padded, longer ones
 * truncated.
 */

#pragma once

#include "KinematicModel.hpp"
#include "MathTypes.hpp"
#include <string>
#include <utility>
#include <vector>

namespace arm_teleop {
namespace kinematics {

/**
 * Frame in which a Jacobian is expressed. Reference point is always the
 * origin of the requested frame.
 */
enum class ReferenceFrame {
    LOCAL,                 // the frame's own axes
    LOCAL_WORLD_ALIGNED    // base axes
};

inline std::string toString(ReferenceFrame rf) {
    switch (rf) {
        case ReferenceFrame::LOCAL:               return "LOCAL";
        case ReferenceFrame::LOCAL_WORLD_ALIGNED: return "LOCAL_WORLD_ALIGNED";
        default:                                  return "UNKNOWN";
    }
}

class IKinematicsProvider {
public:
    virtual ~IKinematicsProvider() = default;

    virtual std::string name() const = 0;

    virtual int numJoints() const = 0;
    virtual std::vector<std::string> jointNames() const = 0;
    virtual std::vector<std::pair<double, double>> jointLimits() const = 0;

    virtual bool hasFrame(const std::string& frameName) const = 0;

    /**
     * @throws UnknownFrameError
     */
    virtual FrameId frameId(const std::string& frameName) const = 0;

    /**
     * Frame placement in the base frame
     * @throws UninitializedFrameError
     */
    virtual Pose forwardKinematics(const VectorXd& q, FrameId frame) const = 0;

    /**
     * 6xN frame Jacobian, rows [linear; angular]. Columns of joints that
     * do not move the frame are zero.
     * @throws UninitializedFrameError
     */
    virtual Jacobian jacobian(const VectorXd& q, FrameId frame, ReferenceFrame reference) const = 0;
};

/**
 * Rotate a LOCAL_WORLD_ALIGNED Jacobian into the frame's own axes
 */
inline Jacobian toLocal(const Jacobian& worldAligned, const Matrix3d& frameRotation) {
    Jacobian J(6, worldAligned.cols());
    Matrix3d Rt = frameRotation.transpose();
    J.topRows<3>() = Rt * worldAligned.topRows<3>();
    J.bottomRows<3>() = Rt * worldAligned.bottomRows<3>();
    return J;
}

} // namespace kinematics
} // namespace arm_teleop
