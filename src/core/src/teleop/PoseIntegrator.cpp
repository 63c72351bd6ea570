/**
 * @file PoseIntegrator.cpp
 * @brief Pose integrator implementation
 */

#include "PoseIntegrator.hpp"
#include <cmath>

namespace arm_teleop {
namespace teleop {

using kinematics::AngleAxisd;

PoseIntegrator::PoseIntegrator(const IntegratorConfig& config)
    : config_(config)
{
}

double PoseIntegrator::applyDeadzone(double value, double threshold) {
    return std::abs(value) > threshold ? value : 0.0;
}

ControllerAxes PoseIntegrator::filtered(const ControllerAxes& axes) const {
    ControllerAxes out = axes;
    out.leftX = applyDeadzone(axes.leftX, config_.deadzone);
    out.leftY = applyDeadzone(axes.leftY, config_.deadzone);
    out.rightX = applyDeadzone(axes.rightX, config_.deadzone);
    out.rightY = applyDeadzone(axes.rightY, config_.deadzone);
    return out;
}

Pose PoseIntegrator::advance(const Pose& current, const ControllerAxes& axes) const {
    ControllerAxes f = filtered(axes);
    return advance(current, f.leftX, f.leftY, f.rightX, f.rightY);
}

Pose PoseIntegrator::advance(const Pose& current, double lx, double ly, double rx, double ry) const {
    if (lx == 0.0 && ly == 0.0 && rx == 0.0 && ry == 0.0) {
        return current;
    }

    const double step = config_.translationSpeed;
    const double rot = kinematics::degToRad(config_.rotationSpeedDeg);

    Vector3d position = current.position + Vector3d(lx * step, 0.0, -ly * step);

    Matrix3d pitch = AngleAxisd(rx * rot, Vector3d::UnitX()).toRotationMatrix();
    Matrix3d yaw = AngleAxisd(-ry * rot, Vector3d::UnitY()).toRotationMatrix();

    return Pose(position, current.rotation * pitch * yaw);
}

} // namespace teleop
} // namespace arm_teleop
