/**
 * @file SimulatedArm.cpp
 * @brief Loopback arm implementation
 */

#include "SimulatedArm.hpp"
#include "../logging/Logger.hpp"
#include <thread>

namespace arm_teleop {
namespace io {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

SimulatedArm::SimulatedArm(const joints::JointValueMap& initialObservation)
    : observation_(initialObservation)
{
    LOG_INFO("SimulatedArm started with {} channels", observation_.size());
}

void SimulatedArm::simulateLatency() const {
    if (latency_.count() > 0) {
        std::this_thread::sleep_for(latency_);
    }
}

std::optional<joints::JointValueMap> SimulatedArm::readObservation() {
    simulateLatency();
    if (!connected_) {
        return std::nullopt;
    }
    return observation_;
}

bool SimulatedArm::sendCommand(const joints::JointValueMap& command) {
    simulateLatency();
    if (!connected_) {
        LOG_WARN("SimulatedArm: command refused, arm disconnected");
        return false;
    }

    for (const auto& [key, value] : command) {
        if (endsWith(key, joints::POSITION_SUFFIX) || endsWith(key, joints::INTENSITY_SUFFIX)) {
            observation_[key] = value;
        }
    }
    lastCommand_ = command;
    ++commandCount_;
    return true;
}

} // namespace io
} // namespace arm_teleop
