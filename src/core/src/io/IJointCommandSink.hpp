/**
 * @file IJointCommandSink.hpp
 * @brief Abstract destination for joint position commands
 */

#pragma once

#include "../joints/JointTypes.hpp"
#include <string>

namespace arm_teleop {
namespace io {

class IJointCommandSink {
public:
    virtual ~IJointCommandSink() = default;

    /**
     * @param command "<joint>.pos" -> device value, optionally "led.intensity"
     * @return false if the command could not be delivered
     */
    virtual bool sendCommand(const joints::JointValueMap& command) = 0;

    virtual std::string getSinkName() const = 0;
};

} // namespace io
} // namespace arm_teleop
