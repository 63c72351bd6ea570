/**
 * @file SafetyGovernor.hpp
 * @brief Per-step joint change limit for commanded joint vectors
 *
 * Accepts a proposed vector only if every joint moves by no more than the
 * threshold relative to the last accepted vector. The first rejection trips
 * the governor; a tripped governor rejects everything for the rest of its
 * lifetime.
 *
 * The reference vector only moves on commit(), after the caller has
 * actually delivered the accepted command.
 */

#pragma once

#include "../joints/JointTypes.hpp"
#include <optional>
#include <string>

namespace arm_teleop {
namespace safety {

using joints::JointVector;
using joints::NUM_JOINTS;

enum class GovernorState {
    UNARMED,
    ARMED,
    TRIPPED
};

inline std::string toString(GovernorState state) {
    switch (state) {
        case GovernorState::UNARMED: return "UNARMED";
        case GovernorState::ARMED:   return "ARMED";
        case GovernorState::TRIPPED: return "TRIPPED";
        default:                     return "UNKNOWN";
    }
}

/**
 * Outcome of a single proposed step
 */
struct SafetyCheckResult {
    bool accepted = false;
    double maxDiff = 0.0;
    int offendingJoint = -1;     // index of the largest change
    double threshold = 0.0;
    JointVector perJointDiff{};

    std::string describe() const;
};

class SafetyGovernor {
public:
    explicit SafetyGovernor(double threshold = 0.5);

    /**
     * Pure check, no state. Non-finite proposals are rejected with an
     * infinite max diff.
     */
    static SafetyCheckResult check(const JointVector& proposed,
                                   const JointVector& previous,
                                   double threshold);

    /**
     * Set the reference vector (the arm's current configuration)
     */
    void arm(const JointVector& initial);

    /**
     * Check against the last accepted vector; reject trips the governor.
     * Always rejects when not armed.
     */
    SafetyCheckResult evaluate(const JointVector& proposed);

    /**
     * evaluate() that throws on rejection
     * @throws SafetyViolation
     */
    void enforce(const JointVector& proposed);

    /**
     * Record a delivered command as the new reference. Ignored unless armed.
     */
    void commit(const JointVector& accepted);

    GovernorState state() const { return m_state; }
    bool isTripped() const { return m_state == GovernorState::TRIPPED; }
    double threshold() const { return m_threshold; }

    /**
     * Last accepted vector, empty before arm()
     */
    std::optional<JointVector> previous() const;

    const SafetyCheckResult& lastResult() const { return m_lastResult; }

private:
    double m_threshold;
    GovernorState m_state = GovernorState::UNARMED;
    JointVector m_previous{};
    SafetyCheckResult m_lastResult;
};

} // namespace safety
} // namespace arm_teleop
