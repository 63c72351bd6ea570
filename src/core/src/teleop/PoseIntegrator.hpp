/**
 * @file PoseIntegrator.hpp
 * @brief Turns controller axes into incremental end-effector pose targets
 */

#pragma once

#include "../kinematics/MathTypes.hpp"
#include <string>

namespace arm_teleop {
namespace teleop {

using kinematics::Matrix3d;
using kinematics::Pose;
using kinematics::Vector3d;

/**
 * One controller sample. Stick axes in [-1, 1]; gripper trigger in [-1, 1].
 */
struct ControllerAxes {
    double leftX = 0.0;
    double leftY = 0.0;
    double rightX = 0.0;
    double rightY = 0.0;
    double gripper = -1.0;

    bool allZero() const {
        return leftX == 0.0 && leftY == 0.0 && rightX == 0.0 && rightY == 0.0;
    }
};

struct IntegratorConfig {
    double translationSpeed = 0.01;    // m per cycle at full deflection
    double rotationSpeedDeg = 1.0;     // deg per cycle at full deflection
    double deadzone = 0.1;
};

/**
 * Fixed per-cycle increments (not scaled by elapsed time):
 *   position += [lx * speed, 0, -ly * speed]   (world axes)
 *   rotation  = rotation * Rx(rx * rot) * Ry(-ry * rot)   (body axes)
 */
class PoseIntegrator {
public:
    explicit PoseIntegrator(const IntegratorConfig& config = {});

    /**
     * Apply deadzone to the stick axes, then advance the pose.
     * All-zero (after deadzone) input returns the pose unchanged.
     */
    Pose advance(const Pose& current, const ControllerAxes& axes) const;

    /**
     * Raw advance without deadzone
     */
    Pose advance(const Pose& current, double lx, double ly, double rx, double ry) const;

    /**
     * |value| <= threshold -> 0, otherwise unchanged
     */
    static double applyDeadzone(double value, double threshold);

    ControllerAxes filtered(const ControllerAxes& axes) const;

    const IntegratorConfig& config() const { return config_; }

private:
    IntegratorConfig config_;
};

} // namespace teleop
} // namespace arm_teleop
