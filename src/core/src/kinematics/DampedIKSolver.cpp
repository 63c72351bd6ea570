/**
 * @file DampedIKSolver.cpp
 * @brief Damped least-squares IK implementation
 */

#include "DampedIKSolver.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>

namespace arm_teleop {
namespace kinematics {

DampedIKSolver::DampedIKSolver(const IKinematicsProvider& provider, const IKOptions& options)
    : provider_(provider), options_(options)
{
}

IKResult DampedIKSolver::solve(const VectorXd& seed, const Pose& target, FrameId frame) const {
    return solve(seed, target, frame, options_);
}

IKResult DampedIKSolver::solve(const VectorXd& seed, const Pose& target, FrameId frame,
                               const IKOptions& options) const {
    IKResult result;
    result.q = seed;

    for (int iter = 0; iter < options.maxIterations; ++iter) {
        Pose current = provider_.forwardKinematics(result.q, frame);
        Vector6d err = poseError(current, target);
        result.residualNorm = err.norm();

        if (result.residualNorm < options.tolerance) {
            clampToLimits(result.q);
            result.converged = true;
            result.iterations = iter;
            LOG_TRACE("IK converged after {} iterations, residual {:.2e}", iter, result.residualNorm);
            return result;
        }

        Jacobian J = provider_.jacobian(result.q, frame, ReferenceFrame::LOCAL);
        MatrixXd H = J.transpose() * J;
        H.diagonal().array() += options.damping;

        Eigen::LDLT<MatrixXd> ldlt(H);
        if (ldlt.info() != Eigen::Success) {
            throw NumericalSolveError(iter, "damped normal matrix factorization failed");
        }
        VectorXd dq = ldlt.solve(J.transpose() * err);
        if (ldlt.info() != Eigen::Success || !dq.allFinite()) {
            throw NumericalSolveError(iter, "non-finite joint step");
        }

        const Eigen::Index n = std::min(result.q.size(), dq.size());
        result.q.head(n) += dq.head(n);
        clampToLimits(result.q);
        result.iterations = iter + 1;
    }

    // Report the residual of the vector actually returned
    Pose final_pose = provider_.forwardKinematics(result.q, frame);
    result.residualNorm = poseError(final_pose, target).norm();
    result.converged = result.residualNorm < options.tolerance;

    if (!result.converged) {
        LOG_DEBUG("IK did not converge in {} iterations, residual {:.2e} (tol {:.1e})",
                  options.maxIterations, result.residualNorm, options.tolerance);
    }
    return result;
}

void DampedIKSolver::clampToLimits(VectorXd& q) const {
    const auto limits = provider_.jointLimits();
    const std::size_t n = std::min<std::size_t>(static_cast<std::size_t>(q.size()), limits.size());
    for (std::size_t i = 0; i < n; ++i) {
        q[i] = std::clamp(q[i], limits[i].first, limits[i].second);
    }
}

} // namespace kinematics
} // namespace arm_teleop
