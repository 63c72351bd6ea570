/**
 * @file ControlLoop.cpp
 * @brief Teleoperation control loop implementation
 */

#include "ControlLoop.hpp"
#include "../errors/Errors.hpp"
#include "../logging/Logger.hpp"
#include <stdexcept>
#include <thread>

namespace arm_teleop {
namespace control {

using kinematics::Pose;
using kinematics::VectorXd;

namespace {

kinematics::IKOptions toIKOptions(const config::IkConfig& ik) {
    kinematics::IKOptions options;
    options.tolerance = ik.tolerance;
    options.maxIterations = ik.max_iterations;
    options.damping = ik.damping;
    return options;
}

teleop::IntegratorConfig toIntegratorConfig(const config::IntegratorSettings& s) {
    teleop::IntegratorConfig cfg;
    cfg.translationSpeed = s.translation_speed;
    cfg.rotationSpeedDeg = s.rotation_speed_deg;
    cfg.deadzone = s.deadzone;
    return cfg;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

ControlLoop::ControlLoop(const config::TeleopConfig& config,
                         const kinematics::IKinematicsProvider& provider,
                         io::IJointStateSource& follower,
                         io::IJointCommandSink& sink,
                         io::IControllerInput* controller,
                         io::IJointStateSource* leader,
                         const joints::JointLimitTable& table)
    : m_config(config)
    , m_provider(provider)
    , m_follower(follower)
    , m_sink(sink)
    , m_controller(controller)
    , m_leader(leader)
    , m_codec(table)
    , m_solver(provider, toIKOptions(config.ik))
    , m_integrator(toIntegratorConfig(config.integrator))
    , m_governor(config.safety.max_joint_step_rad)
    , m_ioTimeout(config.control.io_timeout_ms)
{
    m_mode = (config.control.mode == "leader") ? TargetMode::LEADER : TargetMode::JOYSTICK;

    if (m_mode == TargetMode::JOYSTICK && m_controller == nullptr) {
        throw std::invalid_argument("Joystick mode requires a controller input");
    }
    if (m_mode == TargetMode::LEADER && m_leader == nullptr) {
        throw std::invalid_argument("Leader mode requires a leader joint source");
    }

    LOG_INFO("ControlLoop: mode {}, provider {}, frame '{}', threshold {} rad, cycle {} ms",
             state::toString(m_mode), m_provider.name(), m_config.model.frame,
             m_config.safety.max_joint_step_rad, m_config.control.cycle_time_ms);
}

// ============================================================================
// Initialization
// ============================================================================

bool ControlLoop::initialize() {
    if (m_state != LoopState::INITIALIZING) {
        LOG_WARN("ControlLoop::initialize() called in state {}", state::toString(m_state));
        return m_state == LoopState::RUNNING;
    }

    try {
        m_frame = m_provider.frameId(m_config.model.frame);
    } catch (const UnknownFrameError& e) {
        enterHalted(FaultCode::UNKNOWN_FRAME, e.what());
        return false;
    }

    auto observation = m_follower.readObservation();
    if (!observation) {
        enterHalted(FaultCode::OBSERVATION_UNAVAILABLE,
                    "no initial observation from " + m_follower.getSourceName());
        return false;
    }

    joints::JointVector q{};
    try {
        q = m_codec.decodeObservation(*observation);
    } catch (const IncompleteObservationError& e) {
        enterHalted(FaultCode::OBSERVATION_INCOMPLETE, e.what());
        return false;
    }

    try {
        m_targetPose = m_provider.forwardKinematics(toVector(q), m_frame);
    } catch (const UninitializedFrameError& e) {
        enterHalted(FaultCode::FRAME_UNINITIALIZED, e.what());
        return false;
    }

    m_governor.arm(q);
    m_state = LoopState::RUNNING;

    const auto& p = m_targetPose.position;
    LOG_INFO("ControlLoop running: start pose ({:.4f}, {:.4f}, {:.4f}) m", p.x(), p.y(), p.z());
    return true;
}

// ============================================================================
// Cycle
// ============================================================================

CycleReport ControlLoop::step() {
    CycleReport report;
    report.cycle = m_cycle;

    if (m_state == LoopState::INITIALIZING) {
        report.outcome = CycleOutcome::NOT_RUNNING;
        report.detail = "not initialized";
        return report;
    }
    if (m_state == LoopState::HALTED) {
        report.outcome = CycleOutcome::HALTED;
        report.fault = m_haltReason;
        report.detail = m_haltDetail;
        return report;
    }

    ++m_cycle;

    if (m_stopRequested) {
        return halt(report, FaultCode::INTERRUPTED, "stop requested");
    }

    // 1. Target pose
    Pose target = m_targetPose;
    std::optional<double> gripperDevice;
    joints::JointVector seed = *m_governor.previous();

    if (m_mode == TargetMode::JOYSTICK) {
        double gripper = 0.0;
        if (!joystickTarget(report, target, gripper)) {
            return report;
        }
        if (m_config.gripper.from_controller_axis) {
            gripperDevice = gripper;
        }
    } else {
        joints::JointVector leaderQ{};
        if (!leaderTarget(report, target, leaderQ)) {
            return report;
        }
        seed[joints::index(joints::JointId::GRIPPER)] = leaderQ[joints::index(joints::JointId::GRIPPER)];
    }

    // 2. IK seeded from the last accepted vector
    kinematics::IKResult ik;
    try {
        ik = m_solver.solve(toVector(seed), target, m_frame);
    } catch (const NumericalSolveError& e) {
        return skip(report, FaultCode::IK_NUMERICAL, e.what());
    } catch (const UninitializedFrameError& e) {
        return fault(report, FaultCode::FRAME_UNINITIALIZED, e.what());
    }
    report.ik = ik;

    if (!ik.converged) {
        LOG_WARN("Cycle {}: IK not converged after {} iterations, residual {:.3e}",
                 m_cycle, ik.iterations, ik.residualNorm);
        if (m_config.safety.halt_on_non_convergence) {
            return halt(report, FaultCode::IK_NOT_CONVERGED,
                        "IK residual " + std::to_string(ik.residualNorm) + " after "
                        + std::to_string(ik.iterations) + " iterations");
        }
    }

    joints::JointVector proposed = toJointVector(ik.q, seed);

    // 3. Safety
    safety::SafetyCheckResult check = m_governor.evaluate(proposed);
    if (!check.accepted) {
        if (m_config.safety.hold_last_safe_on_halt) {
            emitHoldCommand();
        }
        return halt(report, FaultCode::SAFETY_VIOLATION, check.describe());
    }

    // 4. Emit
    joints::JointValueMap command = m_codec.encodeCommand(proposed, m_config.led_intensity);
    if (gripperDevice) {
        command[std::string("gripper") + joints::POSITION_SUFFIX] = *gripperDevice;
    }

    auto sendStart = std::chrono::steady_clock::now();
    bool sent = m_sink.sendCommand(command);
    if (!sent) {
        return fault(report, FaultCode::COMMAND_REJECTED, m_sink.getSinkName() + " refused command");
    }

    m_governor.commit(proposed);
    m_lastCommand = command;
    m_targetPose = target;
    ++m_accepted;
    report.command = command;

    if (overran(sendStart)) {
        // Delivered late: the command stands but the fault still counts
        fault(report, FaultCode::IO_TIMEOUT, m_sink.getSinkName() + " send exceeded timeout");
        if (m_state != LoopState::HALTED) {
            report.outcome = CycleOutcome::ACCEPTED;
        }
        return report;
    }

    m_consecutiveFaults = 0;
    report.outcome = CycleOutcome::ACCEPTED;
    LOG_TRACE("Cycle {}: accepted, max joint change {:.4f} rad", m_cycle, check.maxDiff);
    return report;
}

bool ControlLoop::joystickTarget(CycleReport& report, Pose& target, double& gripperDevice) {
    teleop::ControllerAxes axes;

    auto start = std::chrono::steady_clock::now();
    bool ok = m_controller->poll(axes);
    if (!ok) {
        if (m_controller->endOfStream()) {
            halt(report, FaultCode::END_OF_INPUT, m_controller->getInputName() + " exhausted");
        } else if (m_controller->timedOut()) {
            fault(report, FaultCode::IO_TIMEOUT, m_controller->getInputName() + " wait timed out");
        } else {
            fault(report, FaultCode::CONTROLLER_UNAVAILABLE,
                  m_controller->getInputName() + " returned no sample");
        }
        return false;
    }
    if (overran(start)) {
        fault(report, FaultCode::IO_TIMEOUT, m_controller->getInputName() + " poll exceeded timeout");
        return false;
    }

    target = m_integrator.advance(m_targetPose, axes);
    gripperDevice = joints::JointCodec::gripperFromAxis(axes.gripper);
    return true;
}

bool ControlLoop::leaderTarget(CycleReport& report, Pose& target, joints::JointVector& leaderQ) {
    auto start = std::chrono::steady_clock::now();
    auto observation = m_leader->readObservation();
    if (!observation) {
        if (m_leader->endOfStream()) {
            halt(report, FaultCode::END_OF_INPUT, m_leader->getSourceName() + " exhausted");
        } else if (m_leader->timedOut()) {
            fault(report, FaultCode::IO_TIMEOUT, m_leader->getSourceName() + " wait timed out");
        } else {
            fault(report, FaultCode::OBSERVATION_UNAVAILABLE,
                  m_leader->getSourceName() + " returned no observation");
        }
        return false;
    }
    if (overran(start)) {
        fault(report, FaultCode::IO_TIMEOUT, m_leader->getSourceName() + " read exceeded timeout");
        return false;
    }

    try {
        leaderQ = m_codec.decodeObservation(*observation);
    } catch (const IncompleteObservationError& e) {
        skip(report, FaultCode::OBSERVATION_INCOMPLETE, e.what());
        return false;
    } catch (const UnknownJointError& e) {
        skip(report, FaultCode::UNKNOWN_JOINT, e.what());
        return false;
    }

    try {
        target = m_provider.forwardKinematics(toVector(leaderQ), m_frame);
    } catch (const UninitializedFrameError& e) {
        fault(report, FaultCode::FRAME_UNINITIALIZED, e.what());
        return false;
    }
    return true;
}

// ============================================================================
// Fault handling
// ============================================================================

CycleReport& ControlLoop::skip(CycleReport& report, FaultCode code, const std::string& detail) {
    LOG_WARN("Cycle {} skipped [{}]: {}", m_cycle, state::toString(code), detail);
    report.outcome = CycleOutcome::SKIPPED;
    report.fault = code;
    report.detail = detail;
    return report;
}

CycleReport& ControlLoop::fault(CycleReport& report, FaultCode code, const std::string& detail) {
    ++m_consecutiveFaults;
    LOG_WARN("Cycle {} fault [{}] ({}/{}): {}", m_cycle, state::toString(code),
             m_consecutiveFaults, m_config.control.max_consecutive_faults, detail);

    if (m_consecutiveFaults >= m_config.control.max_consecutive_faults) {
        if (m_config.safety.hold_last_safe_on_halt) {
            emitHoldCommand();
        }
        return halt(report, code, detail + " (" + std::to_string(m_consecutiveFaults)
                                  + " consecutive faults)");
    }

    report.outcome = CycleOutcome::SKIPPED;
    report.fault = code;
    report.detail = detail;
    return report;
}

CycleReport& ControlLoop::halt(CycleReport& report, FaultCode code, const std::string& detail) {
    enterHalted(code, detail);
    report.outcome = CycleOutcome::HALTED;
    report.fault = code;
    report.detail = detail;
    return report;
}

void ControlLoop::enterHalted(FaultCode code, const std::string& detail) {
    if (m_state == LoopState::HALTED) {
        return;
    }
    m_state = LoopState::HALTED;
    m_haltReason = code;
    m_haltDetail = detail;

    if (code == FaultCode::INTERRUPTED || code == FaultCode::END_OF_INPUT) {
        LOG_INFO("ControlLoop halted [{}]: {}", state::toString(code), detail);
    } else {
        LOG_ERROR("ControlLoop halted [{}]: {}", state::toString(code), detail);
    }
}

void ControlLoop::emitHoldCommand() {
    // Repeat what the arm last received, including the gripper channel
    joints::JointValueMap hold;
    if (m_lastCommand) {
        hold = *m_lastCommand;
    } else {
        auto previous = m_governor.previous();
        if (!previous) {
            return;
        }
        hold = m_codec.encodeCommand(*previous, m_config.led_intensity);
    }

    if (!m_sink.sendCommand(hold)) {
        LOG_ERROR("Hold command to {} failed", m_sink.getSinkName());
        return;
    }
    LOG_WARN("Hold command sent: {}", m_lastCommand ? "last delivered command" : "initial observation");
}

bool ControlLoop::overran(std::chrono::steady_clock::time_point start) const {
    return std::chrono::steady_clock::now() - start > m_ioTimeout;
}

// ============================================================================
// Run loop
// ============================================================================

void ControlLoop::run(const std::atomic<bool>& running) {
    if (m_state == LoopState::INITIALIZING && !initialize()) {
        return;
    }

    const auto period = std::chrono::milliseconds(m_config.control.cycle_time_ms);
    auto next = std::chrono::steady_clock::now();

    while (m_state == LoopState::RUNNING) {
        if (!running.load()) {
            requestStop();
        }
        step();

        next += period;
        auto now = std::chrono::steady_clock::now();
        if (next > now) {
            std::this_thread::sleep_until(next);
        } else {
            // Overran the period; realign instead of bursting
            next = now;
        }
    }

    LOG_INFO("ControlLoop stopped after {} cycles ({} accepted): {}",
             m_cycle, m_accepted, state::toString(m_haltReason));
}

// ============================================================================
// Conversions
// ============================================================================

VectorXd ControlLoop::toVector(const joints::JointVector& q) {
    VectorXd v(joints::NUM_JOINTS);
    for (int i = 0; i < joints::NUM_JOINTS; ++i) {
        v[i] = q[i];
    }
    return v;
}

joints::JointVector ControlLoop::toJointVector(const VectorXd& q, const joints::JointVector& fallback) {
    joints::JointVector out = fallback;
    for (int i = 0; i < joints::NUM_JOINTS && i < q.size(); ++i) {
        out[i] = q[i];
    }
    return out;
}

} // namespace control
} // namespace arm_teleop
