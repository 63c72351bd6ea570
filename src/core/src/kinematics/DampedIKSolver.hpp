/**
 * @file DampedIKSolver.hpp
 * @brief Damped least-squares inverse kinematics on an IKinematicsProvider
 */

#pragma once

#include "IKinematicsProvider.hpp"
#include <limits>

namespace arm_teleop {
namespace kinematics {

// ============================================================================
// IK Configuration
// ============================================================================

struct IKOptions {
    // Stop when the 6-D error twist norm drops below this
    double tolerance = 1e-3;

    int maxIterations = 10;

    // Levenberg damping added to J^T J
    double damping = 1e-4;
};

// ============================================================================
// IK Result
// ============================================================================

/**
 * Joint vector plus convergence status. A non-converged result is still the
 * best-effort vector after maxIterations steps.
 */
struct IKResult {
    VectorXd q;
    bool converged = false;
    int iterations = 0;     // Linearization steps taken
    double residualNorm = std::numeric_limits<double>::infinity();
};

// ============================================================================
// Solver
// ============================================================================

class DampedIKSolver {
public:
    explicit DampedIKSolver(const IKinematicsProvider& provider, const IKOptions& options = {});

    /**
     * Solve for joints placing `frame` at `target`, seeded from `seed`.
     *
     * Each iteration: err = log6(current^-1 * target) in the frame's local
     * axes, H = J^T J + damping * I, dq = H^-1 J^T err, q[:n] += dq, then
     * clamp to the model limits. Seed entries beyond the model DOF are
     * passed through untouched.
     *
     * @throws UnknownFrameError / UninitializedFrameError from the provider
     * @throws NumericalSolveError if the damped system yields no finite step
     */
    IKResult solve(const VectorXd& seed, const Pose& target, FrameId frame) const;
    IKResult solve(const VectorXd& seed, const Pose& target, FrameId frame,
                   const IKOptions& options) const;

    void setOptions(const IKOptions& options) { options_ = options; }
    const IKOptions& getOptions() const { return options_; }

private:
    void clampToLimits(VectorXd& q) const;

    const IKinematicsProvider& provider_;
    IKOptions options_;
};

} // namespace kinematics
} // namespace arm_teleop
