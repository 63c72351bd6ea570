/**
 * @file JointCodec.cpp
 * @brief Joint codec implementation
 */

#include "JointCodec.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace arm_teleop {
namespace joints {

namespace {

// Values this close to a limit are rounding noise from a round trip
constexpr double CLAMP_WARN_TOLERANCE = 1e-9;

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

JointCodec::JointCodec(const JointLimitTable& table)
    : m_table(table)
{
}

double JointCodec::toRadians(double normalized, JointId id) const {
    const JointSpec& s = m_table.spec(id);
    double v = std::clamp(normalized, NORMALIZED_MIN, NORMALIZED_MAX);
    double ratio = (v - NORMALIZED_MIN) / (NORMALIZED_MAX - NORMALIZED_MIN);
    return s.lower + ratio * s.span();
}

double JointCodec::toRadians(double normalized, const std::string& key) const {
    return toRadians(normalized, m_table.idOf(key));
}

double JointCodec::toNormalized(double radians, JointId id) const {
    const JointSpec& s = m_table.spec(id);
    double clamped = s.clamp(radians);
    if (std::abs(clamped - radians) > CLAMP_WARN_TOLERANCE) {
        LOG_WARN("Joint {} angle {:.5f} rad outside [{:.5f}, {:.5f}], clamped to {:.5f}",
                 s.name, radians, s.lower, s.upper, clamped);
    }
    if (s.span() <= 0.0) {
        return 0.0;
    }
    double ratio = (clamped - s.lower) / s.span();
    return NORMALIZED_MIN + ratio * (NORMALIZED_MAX - NORMALIZED_MIN);
}

double JointCodec::toNormalized(double radians, const std::string& key) const {
    return toNormalized(radians, m_table.idOf(key));
}

JointVector JointCodec::toRadians(const JointVector& normalized) const {
    JointVector out{};
    for (JointId id : ALL_JOINTS) {
        out[index(id)] = toRadians(normalized[index(id)], id);
    }
    return out;
}

JointVector JointCodec::toNormalized(const JointVector& radians) const {
    JointVector out{};
    for (JointId id : ALL_JOINTS) {
        out[index(id)] = toNormalized(radians[index(id)], id);
    }
    return out;
}

ValidationReport JointCodec::validateRadians(const JointValueMap& angles) const {
    ValidationReport report;

    for (const auto& [key, value] : angles) {
        auto id = m_table.find(key);
        if (!id) {
            LOG_WARN("Unknown joint '{}' ignored during validation", key);
            report.dropped.push_back(key);
            continue;
        }

        const JointSpec& s = m_table.spec(*id);
        double clamped = s.clamp(value);
        if (clamped != value) {
            LOG_WARN("Joint {} angle {:.5f} rad outside [{:.5f}, {:.5f}], clamped to {:.5f}",
                     s.name, value, s.lower, s.upper, clamped);
            report.clamped.push_back({key, value, clamped});
        }
        report.angles[key] = clamped;
    }

    return report;
}

JointVector JointCodec::decodeObservation(const JointValueMap& observation) const {
    JointVector q{};
    std::array<bool, NUM_JOINTS> seen{};

    for (const auto& [key, value] : observation) {
        if (endsWith(key, INTENSITY_SUFFIX)) {
            continue;
        }
        auto id = m_table.find(key);
        if (!id) {
            LOG_WARN("Observation key '{}' does not name a joint, dropped", key);
            continue;
        }

        const JointSpec& s = m_table.spec(*id);
        double normalized = s.hardware.toCore(value);
        q[index(*id)] = toRadians(normalized, *id);
        seen[index(*id)] = true;
    }

    for (JointId id : ALL_JOINTS) {
        if (!seen[index(id)]) {
            throw IncompleteObservationError(toString(id));
        }
    }
    return q;
}

JointValueMap JointCodec::encodeCommand(const JointVector& radians,
                                        std::optional<double> ledIntensity) const {
    JointValueMap command;
    for (JointId id : ALL_JOINTS) {
        const JointSpec& s = m_table.spec(id);
        double normalized = toNormalized(radians[index(id)], id);
        command[s.name + POSITION_SUFFIX] = s.hardware.toDevice(normalized);
    }
    if (ledIntensity) {
        command[LED_CHANNEL] = std::clamp(*ledIntensity, 0.0, 100.0);
    }
    return command;
}

double JointCodec::gripperFromAxis(double axis) {
    double a = std::clamp(axis, -1.0, 1.0);
    return std::floor((a + 1.0) * 50.0);
}

} // namespace joints
} // namespace arm_teleop
