/**
 * @file JointLimitTable.hpp
 * @brief Static per-joint limits, axes and hardware sign/offset conventions
 */

#pragma once

#include "JointTypes.hpp"
#include <optional>
#include <string>

namespace arm_teleop {
namespace joints {

/**
 * Affine device convention: core = offset + sign * device.
 * With sign = +/-1 the mapping is its own inverse shape, so encode and
 * decode use the same two numbers.
 */
struct HardwareTransform {
    double sign = 1.0;
    double offset = 0.0;

    double toCore(double deviceValue) const { return offset + sign * deviceValue; }
    double toDevice(double coreValue) const { return (coreValue - offset) * sign; }
};

/**
 * Per-joint bounds and metadata
 */
struct JointSpec {
    JointId id = JointId::SHOULDER_PAN;
    std::string name;
    double lower = 0.0;                      // rad
    double upper = 0.0;                      // rad
    std::array<double, 3> axis = {0, 0, 1};  // visualization only
    HardwareTransform hardware;

    double span() const { return upper - lower; }
    double clamp(double radians) const;
};

/**
 * Immutable joint table shared for the process lifetime.
 */
class JointLimitTable {
public:
    explicit JointLimitTable(const std::array<JointSpec, NUM_JOINTS>& specs);

    /**
     * Built-in table for the six-joint desk arm
     */
    static const JointLimitTable& so101();

    const JointSpec& spec(JointId id) const { return m_specs[index(id)]; }

    /**
     * Lookup by name; accepts "<name>" or "<name>.pos"
     * @throws UnknownJointError
     */
    const JointSpec& spec(const std::string& key) const;

    std::optional<JointId> find(const std::string& key) const;

    /**
     * @throws UnknownJointError
     */
    JointId idOf(const std::string& key) const;

    const std::array<JointSpec, NUM_JOINTS>& specs() const { return m_specs; }

    JointVector clamp(const JointVector& radians) const;

    /**
     * "shoulder_pan.pos" -> "shoulder_pan"; other suffixes ("gripper.vel")
     * are kept, so they never name a joint
     */
    static std::string stripSuffix(const std::string& key);

private:
    std::array<JointSpec, NUM_JOINTS> m_specs;
};

} // namespace joints
} // namespace arm_teleop
