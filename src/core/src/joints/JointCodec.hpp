/**
 * @file JointCodec.hpp
 * @brief Conversion between device-normalized joint values and radians
 *
 * Normalized values live in [-100, 100] and map linearly onto each joint's
 * [lower, upper] radian range. Observation decoding and command encoding
 * additionally apply the per-joint hardware sign/offset transform.
 */

#pragma once

#include "JointLimitTable.hpp"
#include <optional>
#include <string>
#include <vector>

namespace arm_teleop {
namespace joints {

struct ClampedEntry {
    std::string joint;
    double original = 0.0;
    double clamped = 0.0;
};

/**
 * Outcome of validateRadians(): sanitized map plus what was changed
 */
struct ValidationReport {
    JointValueMap angles;
    std::vector<ClampedEntry> clamped;
    std::vector<std::string> dropped;

    bool clean() const { return clamped.empty() && dropped.empty(); }
};

class JointCodec {
public:
    explicit JointCodec(const JointLimitTable& table = JointLimitTable::so101());

    double toRadians(double normalized, JointId id) const;

    /**
     * @throws UnknownJointError
     */
    double toRadians(double normalized, const std::string& key) const;

    /**
     * Out-of-range input is clamped to [lower, upper] with a warning.
     */
    double toNormalized(double radians, JointId id) const;

    /**
     * @throws UnknownJointError
     */
    double toNormalized(double radians, const std::string& key) const;

    JointVector toRadians(const JointVector& normalized) const;
    JointVector toNormalized(const JointVector& radians) const;

    /**
     * Clamp every known entry to its limits; unknown keys are dropped.
     * Never throws for bad entries, reports them instead.
     */
    ValidationReport validateRadians(const JointValueMap& angles) const;

    /**
     * Device observation ("<joint>.pos" -> device value) to radians.
     * ".intensity" channels are ignored, unknown keys are dropped with a
     * warning.
     * @throws IncompleteObservationError if a joint is missing
     */
    JointVector decodeObservation(const JointValueMap& observation) const;

    /**
     * Radians to a device command ("<joint>.pos" -> device value).
     * @param ledIntensity optional LED channel, clamped to [0, 100]
     */
    JointValueMap encodeCommand(const JointVector& radians,
                                std::optional<double> ledIntensity = std::nullopt) const;

    /**
     * Controller trigger axis in [-1, 1] to gripper device value in [0, 100]
     */
    static double gripperFromAxis(double axis);

    const JointLimitTable& table() const { return m_table; }

private:
    const JointLimitTable& m_table;
};

} // namespace joints
} // namespace arm_teleop
