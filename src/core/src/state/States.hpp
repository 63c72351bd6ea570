/**
 * @file States.hpp
 * @brief Control loop state, fault and mode definitions
 */

#pragma once

#include <string>
#include <cstdint>

namespace arm_teleop {
namespace state {

/**
 * Control loop states
 */
enum class LoopState : uint8_t {
    INITIALIZING = 0,   // Waiting for first observation + FK
    RUNNING,            // Streaming commands
    HALTED              // Terminal for the process lifetime
};

/**
 * Where the target pose comes from
 */
enum class TargetMode : uint8_t {
    JOYSTICK = 0,       // Rate integration of controller axes
    LEADER              // FK of a leader arm observation
};

/**
 * Outcome of one control cycle
 */
enum class CycleOutcome : uint8_t {
    ACCEPTED = 0,       // Command emitted
    SKIPPED,            // Transient fault, nothing emitted
    HALTED,             // Loop entered (or already in) HALTED
    NOT_RUNNING         // step() called before initialize()
};

/**
 * Fault codes
 */
enum class FaultCode : uint16_t {
    NONE = 0,

    // Input / boundary (100-199)
    OBSERVATION_UNAVAILABLE = 100,
    OBSERVATION_INCOMPLETE,
    CONTROLLER_UNAVAILABLE,
    IO_TIMEOUT,
    COMMAND_REJECTED,
    UNKNOWN_JOINT,

    // Kinematics (200-299)
    UNKNOWN_FRAME = 200,
    FRAME_UNINITIALIZED,
    IK_NUMERICAL,
    IK_NOT_CONVERGED,

    // Safety (300-399)
    SAFETY_VIOLATION = 300,

    // Operator (900-999)
    INTERRUPTED = 900,
    END_OF_INPUT
};

// String conversion functions
inline std::string toString(LoopState state) {
    switch (state) {
        case LoopState::INITIALIZING: return "INITIALIZING";
        case LoopState::RUNNING:      return "RUNNING";
        case LoopState::HALTED:       return "HALTED";
        default:                      return "UNKNOWN";
    }
}

inline std::string toString(TargetMode mode) {
    switch (mode) {
        case TargetMode::JOYSTICK: return "JOYSTICK";
        case TargetMode::LEADER:   return "LEADER";
        default:                   return "UNKNOWN";
    }
}

inline std::string toString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::ACCEPTED:    return "ACCEPTED";
        case CycleOutcome::SKIPPED:     return "SKIPPED";
        case CycleOutcome::HALTED:      return "HALTED";
        case CycleOutcome::NOT_RUNNING: return "NOT_RUNNING";
        default:                        return "UNKNOWN";
    }
}

inline std::string toString(FaultCode code) {
    switch (code) {
        case FaultCode::NONE:                    return "NONE";
        case FaultCode::OBSERVATION_UNAVAILABLE: return "OBSERVATION_UNAVAILABLE";
        case FaultCode::OBSERVATION_INCOMPLETE:  return "OBSERVATION_INCOMPLETE";
        case FaultCode::CONTROLLER_UNAVAILABLE:  return "CONTROLLER_UNAVAILABLE";
        case FaultCode::IO_TIMEOUT:              return "IO_TIMEOUT";
        case FaultCode::COMMAND_REJECTED:        return "COMMAND_REJECTED";
        case FaultCode::UNKNOWN_JOINT:           return "UNKNOWN_JOINT";
        case FaultCode::UNKNOWN_FRAME:           return "UNKNOWN_FRAME";
        case FaultCode::FRAME_UNINITIALIZED:     return "FRAME_UNINITIALIZED";
        case FaultCode::IK_NUMERICAL:            return "IK_NUMERICAL";
        case FaultCode::IK_NOT_CONVERGED:        return "IK_NOT_CONVERGED";
        case FaultCode::SAFETY_VIOLATION:        return "SAFETY_VIOLATION";
        case FaultCode::INTERRUPTED:             return "INTERRUPTED";
        case FaultCode::END_OF_INPUT:            return "END_OF_INPUT";
        default:                                 return "UNKNOWN_FAULT";
    }
}

} // namespace state
} // namespace arm_teleop
