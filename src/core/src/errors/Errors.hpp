/**
 * @file Errors.hpp
 * @brief Exception types raised by the codec, kinematics, IK and safety layers
 *
 * Each exception carries the context an operator needs to tell the faults
 * apart (which joint, which frame, how far, what threshold).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace arm_teleop {

/**
 * Joint key not present in the joint limit table
 */
class UnknownJointError : public std::runtime_error {
public:
    explicit UnknownJointError(const std::string& key)
        : std::runtime_error("Unknown joint: '" + key + "'"), m_key(key) {}

    const std::string& key() const { return m_key; }

private:
    std::string m_key;
};

/**
 * Observation is missing a joint required to build a full joint vector
 */
class IncompleteObservationError : public std::runtime_error {
public:
    explicit IncompleteObservationError(const std::string& joint)
        : std::runtime_error("Observation is missing joint '" + joint + "'"), m_joint(joint) {}

    const std::string& joint() const { return m_joint; }

private:
    std::string m_joint;
};

/**
 * Frame name not present in the kinematic model
 */
class UnknownFrameError : public std::runtime_error {
public:
    explicit UnknownFrameError(const std::string& frame)
        : std::runtime_error("Unknown frame: '" + frame + "'"), m_frame(frame) {}

    const std::string& frame() const { return m_frame; }

private:
    std::string m_frame;
};

/**
 * Frame placement could not be computed (model not built, stale id, bad input)
 */
class UninitializedFrameError : public std::runtime_error {
public:
    UninitializedFrameError(const std::string& frame, const std::string& detail)
        : std::runtime_error("Frame placement for '" + frame + "' is not available: " + detail),
          m_frame(frame) {}

    const std::string& frame() const { return m_frame; }

private:
    std::string m_frame;
};

/**
 * Damped normal system could not be solved to a finite step
 */
class NumericalSolveError : public std::runtime_error {
public:
    NumericalSolveError(int iteration, const std::string& detail)
        : std::runtime_error("IK linear solve failed at iteration " + std::to_string(iteration)
                             + ": " + detail),
          m_iteration(iteration) {}

    int iteration() const { return m_iteration; }

private:
    int m_iteration;
};

/**
 * Proposed joint step exceeds the per-step threshold
 */
class SafetyViolation : public std::runtime_error {
public:
    SafetyViolation(const std::string& message, int joint, double maxDiff, double threshold)
        : std::runtime_error(message), m_joint(joint), m_maxDiff(maxDiff), m_threshold(threshold) {}

    int joint() const { return m_joint; }
    double maxDiff() const { return m_maxDiff; }
    double threshold() const { return m_threshold; }

private:
    int m_joint;
    double m_maxDiff;
    double m_threshold;
};

} // namespace arm_teleop
