/**
 * @file JointLimitTable.cpp
 * @brief Joint limit table implementation
 */

#include "JointLimitTable.hpp"
#include "../errors/Errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace arm_teleop {
namespace joints {

double JointSpec::clamp(double radians) const {
    return std::clamp(radians, lower, upper);
}

JointLimitTable::JointLimitTable(const std::array<JointSpec, NUM_JOINTS>& specs)
    : m_specs(specs)
{
    for (int i = 0; i < NUM_JOINTS; ++i) {
        if (index(m_specs[i].id) != i) {
            throw std::invalid_argument("Joint table entry " + std::to_string(i)
                                        + " is out of order: " + m_specs[i].name);
        }
        if (m_specs[i].lower > m_specs[i].upper) {
            throw std::invalid_argument("Joint '" + m_specs[i].name + "' has lower > upper");
        }
    }
}

const JointLimitTable& JointLimitTable::so101() {
    // Limits in radians; gripper reads complemented (100 - v) and
    // shoulder_pan negated on this hardware.
    static const JointLimitTable table({{
        {JointId::SHOULDER_PAN,  "shoulder_pan",  -1.91986, 1.91986,  {0, 0, 1}, {-1.0, 0.0}},
        {JointId::SHOULDER_LIFT, "shoulder_lift", -1.74533, 1.74533,  {0, 1, 0}, {1.0, 0.0}},
        {JointId::ELBOW_FLEX,    "elbow_flex",    -1.69,    1.69,     {0, 0, 1}, {1.0, 0.0}},
        {JointId::WRIST_FLEX,    "wrist_flex",    -1.65806, 1.65806,  {0, 0, 1}, {1.0, 0.0}},
        {JointId::WRIST_ROLL,    "wrist_roll",    -2.74385, 2.84121,  {0, 1, 0}, {1.0, 0.0}},
        {JointId::GRIPPER,       "gripper",       -1.74533, 0.174533, {0, 1, 0}, {-1.0, 100.0}},
    }});
    return table;
}

std::string JointLimitTable::stripSuffix(const std::string& key) {
    const std::string suffix = POSITION_SUFFIX;
    if (key.size() > suffix.size()
        && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return key.substr(0, key.size() - suffix.size());
    }
    return key;
}

std::optional<JointId> JointLimitTable::find(const std::string& key) const {
    std::string name = stripSuffix(key);
    for (const auto& s : m_specs) {
        if (s.name == name) {
            return s.id;
        }
    }
    return std::nullopt;
}

JointId JointLimitTable::idOf(const std::string& key) const {
    auto id = find(key);
    if (!id) {
        throw UnknownJointError(key);
    }
    return *id;
}

const JointSpec& JointLimitTable::spec(const std::string& key) const {
    return spec(idOf(key));
}

JointVector JointLimitTable::clamp(const JointVector& radians) const {
    JointVector out = radians;
    for (int i = 0; i < NUM_JOINTS; ++i) {
        out[i] = m_specs[i].clamp(radians[i]);
    }
    return out;
}

} // namespace joints
} // namespace arm_teleop
