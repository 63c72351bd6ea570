/**
 * @file SafetyGovernor.cpp
 * @brief Safety governor implementation
 */

#include "SafetyGovernor.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace arm_teleop {
namespace safety {

std::string SafetyCheckResult::describe() const {
    std::ostringstream oss;
    if (accepted) {
        oss << "accepted, max joint change " << maxDiff << " rad";
        return oss.str();
    }
    oss << "rejected: joint ";
    if (offendingJoint >= 0) {
        oss << joints::toString(static_cast<joints::JointId>(offendingJoint));
    } else {
        oss << "?";
    }
    oss << " would move " << maxDiff << " rad (limit " << threshold << " rad per step)";
    return oss.str();
}

SafetyGovernor::SafetyGovernor(double threshold)
    : m_threshold(threshold)
{
    if (!(threshold > 0.0) || !std::isfinite(threshold)) {
        throw std::invalid_argument("Safety threshold must be positive and finite");
    }
}

SafetyCheckResult SafetyGovernor::check(const JointVector& proposed,
                                        const JointVector& previous,
                                        double threshold) {
    SafetyCheckResult result;
    result.threshold = threshold;

    for (int i = 0; i < NUM_JOINTS; ++i) {
        double diff = std::abs(proposed[i] - previous[i]);
        if (!std::isfinite(diff)) {
            diff = std::numeric_limits<double>::infinity();
        }
        result.perJointDiff[i] = diff;

        if (result.offendingJoint < 0 || diff > result.maxDiff) {
            result.maxDiff = diff;
            result.offendingJoint = i;
        }
    }

    result.accepted = result.maxDiff <= threshold;
    return result;
}

void SafetyGovernor::arm(const JointVector& initial) {
    if (m_state == GovernorState::TRIPPED) {
        LOG_WARN("Safety governor is tripped; arm() ignored");
        return;
    }
    m_previous = initial;
    m_state = GovernorState::ARMED;
    LOG_DEBUG("Safety governor armed, threshold {} rad", m_threshold);
}

SafetyCheckResult SafetyGovernor::evaluate(const JointVector& proposed) {
    if (m_state != GovernorState::ARMED) {
        m_lastResult = SafetyCheckResult{};
        m_lastResult.threshold = m_threshold;
        LOG_WARN("Safety governor {}: proposal rejected", toString(m_state));
        return m_lastResult;
    }

    m_lastResult = check(proposed, m_previous, m_threshold);

    if (!m_lastResult.accepted) {
        m_state = GovernorState::TRIPPED;
        LOG_ERROR("Safety governor tripped: {}", m_lastResult.describe());
    }
    return m_lastResult;
}

void SafetyGovernor::commit(const JointVector& accepted) {
    if (m_state != GovernorState::ARMED) {
        LOG_WARN("Safety governor {}: commit ignored", toString(m_state));
        return;
    }
    m_previous = accepted;
}

void SafetyGovernor::enforce(const JointVector& proposed) {
    SafetyCheckResult result = evaluate(proposed);
    if (!result.accepted) {
        throw SafetyViolation(result.describe(), result.offendingJoint,
                              result.maxDiff, result.threshold);
    }
}

std::optional<JointVector> SafetyGovernor::previous() const {
    if (m_state == GovernorState::UNARMED) {
        return std::nullopt;
    }
    return m_previous;
}

} // namespace safety
} // namespace arm_teleop
