/**
 * @file IJointStateSource.hpp
 * @brief Abstract source of joint observations (follower arm or leader arm)
 */

#pragma once

#include "../joints/JointTypes.hpp"
#include <optional>
#include <string>

namespace arm_teleop {
namespace io {

class IJointStateSource {
public:
    virtual ~IJointStateSource() = default;

    /**
     * Latest observation, "<joint>.pos" -> device value.
     * std::nullopt when the device could not be read this cycle.
     */
    virtual std::optional<joints::JointValueMap> readObservation() = 0;

    /**
     * True once a finite source has no more observations
     */
    virtual bool endOfStream() const { return false; }

    /**
     * True when the last read gave up waiting for an observation
     */
    virtual bool timedOut() const { return false; }

    virtual std::string getSourceName() const = 0;
};

} // namespace io
} // namespace arm_teleop
