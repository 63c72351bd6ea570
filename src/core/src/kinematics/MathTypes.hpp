/**
 * @file MathTypes.hpp
 * @brief Math types and SE(3) utilities for arm kinematics
 */

#pragma once

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <array>
#include <cmath>

namespace arm_teleop {
namespace kinematics {

// ============================================================================
// Type Definitions
// ============================================================================

using Vector3d = Eigen::Vector3d;
using Vector6d = Eigen::Matrix<double, 6, 1>;
using VectorXd = Eigen::VectorXd;
using Matrix3d = Eigen::Matrix3d;
using MatrixXd = Eigen::MatrixXd;
using AngleAxisd = Eigen::AngleAxisd;

// 6xN frame Jacobian, rows [linear(3); angular(3)]
using Jacobian = Eigen::Matrix<double, 6, Eigen::Dynamic>;

// ============================================================================
// Constants
// ============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;

// ============================================================================
// Utility Functions
// ============================================================================

inline double degToRad(double degrees) {
    return degrees * DEG_TO_RAD;
}

/**
 * Convert URDF RPY angles to rotation matrix
 * Convention: R = Rz(yaw) * Ry(pitch) * Rx(roll)
 */
inline Matrix3d rpyToRotation(const Vector3d& rpy) {
    return (AngleAxisd(rpy(2), Vector3d::UnitZ())
          * AngleAxisd(rpy(1), Vector3d::UnitY())
          * AngleAxisd(rpy(0), Vector3d::UnitX())).toRotationMatrix();
}

inline Matrix3d skew(const Vector3d& v) {
    Matrix3d S;
    S <<     0, -v.z(),  v.y(),
         v.z(),      0, -v.x(),
        -v.y(),  v.x(),      0;
    return S;
}

// ============================================================================
// Pose (rigid transform)
// ============================================================================

/**
 * Rigid transform: translation + rotation.
 * Value type; operations return new poses.
 */
struct Pose {
    Vector3d position;
    Matrix3d rotation;

    Pose()
        : position(Vector3d::Zero()), rotation(Matrix3d::Identity()) {}

    Pose(const Vector3d& p, const Matrix3d& R)
        : position(p), rotation(R) {}

    static Pose identity() { return Pose(); }

    Pose inverse() const {
        Matrix3d Rt = rotation.transpose();
        return Pose(-Rt * position, Rt);
    }

    Pose operator*(const Pose& other) const {
        return Pose(position + rotation * other.position, rotation * other.rotation);
    }

    Pose translated(const Vector3d& delta) const {
        return Pose(position + delta, rotation);
    }
};

// ============================================================================
// SE(3) logarithm
// ============================================================================

/**
 * Rotation vector (axis * angle) of a rotation matrix
 */
inline Vector3d log3(const Matrix3d& R) {
    AngleAxisd aa(R);
    return aa.angle() * aa.axis();
}

/**
 * Minimal body twist [v; w] such that exp(twist) == T
 *
 * v = V(w)^-1 * p with
 * V^-1 = I - 1/2 [w]x + (1/theta^2) (1 - (theta/2) cot(theta/2)) [w]x^2
 */
inline Vector6d log6(const Pose& T) {
    Vector3d w = log3(T.rotation);
    double theta = w.norm();
    Matrix3d W = skew(w);

    double coeff;
    if (theta < 1e-4) {
        // Series expansion of the coefficient around theta = 0
        coeff = 1.0 / 12.0 + theta * theta / 720.0;
    } else {
        double half = 0.5 * theta;
        coeff = (1.0 - half * std::cos(half) / std::sin(half)) / (theta * theta);
    }
    Matrix3d Vinv = Matrix3d::Identity() - 0.5 * W + coeff * W * W;

    Vector6d twist;
    twist.head<3>() = Vinv * T.position;
    twist.tail<3>() = w;
    return twist;
}

/**
 * Pose error between two poses in the local frame of `current`
 */
inline Vector6d poseError(const Pose& current, const Pose& target) {
    return log6(current.inverse() * target);
}

} // namespace kinematics
} // namespace arm_teleop
