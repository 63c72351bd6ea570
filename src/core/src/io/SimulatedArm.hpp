/**
 * @file SimulatedArm.hpp
 * @brief Loopback arm: commanded positions become the next observation
 */

#pragma once

#include "IJointCommandSink.hpp"
#include "IJointStateSource.hpp"
#include <chrono>

namespace arm_teleop {
namespace io {

class SimulatedArm : public IJointStateSource, public IJointCommandSink {
public:
    explicit SimulatedArm(const joints::JointValueMap& initialObservation);
    ~SimulatedArm() override = default;

    std::optional<joints::JointValueMap> readObservation() override;
    std::string getSourceName() const override { return "SimulatedArm"; }

    bool sendCommand(const joints::JointValueMap& command) override;
    std::string getSinkName() const override { return "SimulatedArm"; }

    /**
     * Disconnected: reads return nullopt and commands are refused
     */
    void setConnected(bool connected) { connected_ = connected; }
    bool isConnected() const { return connected_; }

    /**
     * Added to every read and send
     */
    void setLatency(std::chrono::milliseconds latency) { latency_ = latency; }

    const joints::JointValueMap& observation() const { return observation_; }
    const joints::JointValueMap& lastCommand() const { return lastCommand_; }
    int commandCount() const { return commandCount_; }

private:
    void simulateLatency() const;

    joints::JointValueMap observation_;
    joints::JointValueMap lastCommand_;
    int commandCount_ = 0;
    bool connected_ = true;
    std::chrono::milliseconds latency_{0};
};

} // namespace io
} // namespace arm_teleop
