/**
 * @file ControlLoop.hpp
 * @brief Teleoperation control loop: target pose -> IK -> safety -> command
 *
 * States: INITIALIZING -> RUNNING -> HALTED (terminal).
 *
 * One cycle:
 *   1. stop requested?            -> HALTED (INTERRUPTED)
 *   2. target: integrate controller axes, or FK of the leader observation
 *   3. IK seeded from the last accepted joint vector
 *   4. governor check             -> reject: optional hold command, HALTED
 *   5. encode, emit, commit
 *
 * Codec and numerical errors skip the cycle. Provider and I/O faults skip
 * too, but max_consecutive_faults of them in a row halt the loop.
 */

#pragma once

#include "../config/TeleopConfig.hpp"
#include "../io/IControllerInput.hpp"
#include "../io/IJointCommandSink.hpp"
#include "../io/IJointStateSource.hpp"
#include "../joints/JointCodec.hpp"
#include "../kinematics/DampedIKSolver.hpp"
#include "../kinematics/IKinematicsProvider.hpp"
#include "../safety/SafetyGovernor.hpp"
#include "../state/States.hpp"
#include "../teleop/PoseIntegrator.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace arm_teleop {
namespace control {

using state::CycleOutcome;
using state::FaultCode;
using state::LoopState;
using state::TargetMode;

/**
 * What happened in one step()
 */
struct CycleReport {
    int cycle = 0;
    CycleOutcome outcome = CycleOutcome::NOT_RUNNING;
    FaultCode fault = FaultCode::NONE;
    std::string detail;
    std::optional<kinematics::IKResult> ik;
    std::optional<joints::JointValueMap> command;
};

class ControlLoop {
public:
    /**
     * @param follower  arm being commanded (read once at initialization)
     * @param sink      command destination
     * @param controller required in joystick mode
     * @param leader     required in leader mode
     */
    ControlLoop(const config::TeleopConfig& config,
                const kinematics::IKinematicsProvider& provider,
                io::IJointStateSource& follower,
                io::IJointCommandSink& sink,
                io::IControllerInput* controller,
                io::IJointStateSource* leader = nullptr,
                const joints::JointLimitTable& table = joints::JointLimitTable::so101());

    /**
     * Read one observation, compute the starting pose, arm the governor.
     * @return true if RUNNING; false leaves the loop HALTED with a reason
     */
    bool initialize();

    /**
     * Execute one synchronous cycle
     */
    CycleReport step();

    /**
     * Fixed-period loop until HALTED or `running` goes false
     */
    void run(const std::atomic<bool>& running);

    /**
     * Cooperative cancellation, honored at the start of the next cycle
     */
    void requestStop() { m_stopRequested = true; }

    LoopState state() const { return m_state; }
    TargetMode mode() const { return m_mode; }
    FaultCode haltReason() const { return m_haltReason; }
    const std::string& haltDetail() const { return m_haltDetail; }

    const kinematics::Pose& targetPose() const { return m_targetPose; }
    std::optional<joints::JointVector> lastAccepted() const { return m_governor.previous(); }
    const std::optional<joints::JointValueMap>& lastCommand() const { return m_lastCommand; }
    const safety::SafetyGovernor& governor() const { return m_governor; }

    int cycleCount() const { return m_cycle; }
    int acceptedCount() const { return m_accepted; }
    int consecutiveFaults() const { return m_consecutiveFaults; }

private:
    // Target sources
    bool joystickTarget(CycleReport& report, kinematics::Pose& target, double& gripperDevice);
    bool leaderTarget(CycleReport& report, kinematics::Pose& target, joints::JointVector& leaderQ);

    /**
     * Count a boundary/provider fault; halts once the limit is reached
     */
    CycleReport& fault(CycleReport& report, FaultCode code, const std::string& detail);

    /**
     * Transient fault that does not count toward the halt limit
     */
    CycleReport& skip(CycleReport& report, FaultCode code, const std::string& detail);

    CycleReport& halt(CycleReport& report, FaultCode code, const std::string& detail);
    void enterHalted(FaultCode code, const std::string& detail);
    void emitHoldCommand();

    bool overran(std::chrono::steady_clock::time_point start) const;

    static kinematics::VectorXd toVector(const joints::JointVector& q);
    static joints::JointVector toJointVector(const kinematics::VectorXd& q, const joints::JointVector& fallback);

    config::TeleopConfig m_config;
    const kinematics::IKinematicsProvider& m_provider;
    io::IJointStateSource& m_follower;
    io::IJointCommandSink& m_sink;
    io::IControllerInput* m_controller;
    io::IJointStateSource* m_leader;

    joints::JointCodec m_codec;
    kinematics::DampedIKSolver m_solver;
    teleop::PoseIntegrator m_integrator;
    safety::SafetyGovernor m_governor;

    TargetMode m_mode = TargetMode::JOYSTICK;
    LoopState m_state = LoopState::INITIALIZING;
    FaultCode m_haltReason = FaultCode::NONE;
    std::string m_haltDetail;

    kinematics::FrameId m_frame = 0;
    kinematics::Pose m_targetPose;
    std::optional<joints::JointValueMap> m_lastCommand;
    std::chrono::milliseconds m_ioTimeout;

    std::atomic<bool> m_stopRequested{false};
    int m_cycle = 0;
    int m_accepted = 0;
    int m_consecutiveFaults = 0;
};

} // namespace control
} // namespace arm_teleop
