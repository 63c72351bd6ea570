/**
 * @file IControllerInput.hpp
 * @brief Abstract game controller input
 */

#pragma once

#include "../teleop/PoseIntegrator.hpp"
#include <string>

namespace arm_teleop {
namespace io {

class IControllerInput {
public:
    virtual ~IControllerInput() = default;

    /**
     * Read the current axes
     * @return false if no sample is available this cycle
     */
    virtual bool poll(teleop::ControllerAxes& axes) = 0;

    /**
     * True once a scripted input has been fully consumed
     */
    virtual bool endOfStream() const = 0;

    /**
     * True when the last poll gave up waiting for a sample
     */
    virtual bool timedOut() const { return false; }

    virtual std::string getInputName() const = 0;
};

} // namespace io
} // namespace arm_teleop
