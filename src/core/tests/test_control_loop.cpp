/**
 * @file test_control_loop.cpp
 * @brief Teleoperation control loop tests with scripted inputs
 */

#include <gtest/gtest.h>
#include "control/ControlLoop.hpp"
#include "io/SimulatedArm.hpp"
#include "kinematics/UrdfChainKinematics.hpp"
#include "logging/Logger.hpp"
#include "test_models.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

using namespace arm_teleop;
using namespace arm_teleop::control;
using arm_teleop::joints::JointValueMap;
using arm_teleop::joints::JointVector;
using arm_teleop::teleop::ControllerAxes;

namespace {

// ============================================================================
// Scripted test doubles
// ============================================================================

class ScriptedController : public io::IControllerInput {
public:
    // std::nullopt entries model a cycle with no sample
    std::deque<std::optional<ControllerAxes>> script;
    // Polls (1-based) that give up waiting instead of returning a sample
    std::set<int> stalls;
    int polls = 0;
    bool stalled = false;

    void push(double lx, double ly = 0.0, double rx = 0.0, double ry = 0.0, double gripper = -1.0) {
        ControllerAxes axes;
        axes.leftX = lx;
        axes.leftY = ly;
        axes.rightX = rx;
        axes.rightY = ry;
        axes.gripper = gripper;
        script.push_back(axes);
    }
    void pushMissing() { script.push_back(std::nullopt); }

    bool poll(ControllerAxes& axes) override {
        ++polls;
        stalled = stalls.count(polls) > 0;
        if (stalled) {
            return false;
        }
        if (script.empty()) {
            return false;
        }
        auto next = script.front();
        script.pop_front();
        if (!next) {
            return false;
        }
        axes = *next;
        return true;
    }
    bool endOfStream() const override { return !stalled && script.empty(); }
    bool timedOut() const override { return stalled; }
    std::string getInputName() const override { return "ScriptedController"; }
};

class ScriptedLeader : public io::IJointStateSource {
public:
    std::deque<std::optional<JointValueMap>> script;

    std::optional<JointValueMap> readObservation() override {
        if (script.empty()) {
            return std::nullopt;
        }
        auto next = script.front();
        script.pop_front();
        return next;
    }
    bool endOfStream() const override { return script.empty(); }
    std::string getSourceName() const override { return "ScriptedLeader"; }
};

class RecordingSink : public io::IJointCommandSink {
public:
    std::vector<JointValueMap> commands;
    bool accept = true;

    bool sendCommand(const JointValueMap& command) override {
        if (!accept) {
            return false;
        }
        commands.push_back(command);
        return true;
    }
    std::string getSinkName() const override { return "RecordingSink"; }
};

// FK is fixed at the origin; the Jacobian is poisoned
class BrokenJacobianProvider : public kinematics::IKinematicsProvider {
public:
    std::string name() const override { return "broken"; }
    int numJoints() const override { return joints::NUM_JOINTS; }
    std::vector<std::string> jointNames() const override {
        std::vector<std::string> names;
        for (auto id : joints::ALL_JOINTS) names.push_back(joints::toString(id));
        return names;
    }
    std::vector<std::pair<double, double>> jointLimits() const override {
        std::vector<std::pair<double, double>> limits;
        for (const auto& s : joints::JointLimitTable::so101().specs()) {
            limits.emplace_back(s.lower, s.upper);
        }
        return limits;
    }
    bool hasFrame(const std::string&) const override { return true; }
    kinematics::FrameId frameId(const std::string&) const override { return 0; }
    kinematics::Pose forwardKinematics(const kinematics::VectorXd&, kinematics::FrameId) const override {
        return kinematics::Pose::identity();
    }
    kinematics::Jacobian jacobian(const kinematics::VectorXd&, kinematics::FrameId,
                                  kinematics::ReferenceFrame) const override {
        return kinematics::Jacobian::Constant(6, joints::NUM_JOINTS,
                                              std::numeric_limits<double>::quiet_NaN());
    }
};

} // anonymous namespace

// ============================================================================
// Fixture
// ============================================================================

class ControlLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_control_loop.log", "debug");
        kin_ = std::make_unique<kinematics::UrdfChainKinematics>(test::syntheticArmModel());
        config_.model.frame = "gripper_link";
        config_.control.cycle_time_ms = 1;
        follower_ = std::make_unique<io::SimulatedArm>(config_.simulation.initial_observation);
    }

    std::unique_ptr<ControlLoop> makeLoop() {
        return std::make_unique<ControlLoop>(config_, *kin_, *follower_, sink_, &controller_);
    }

    JointVector initialJoints() const {
        return codec_.decodeObservation(config_.simulation.initial_observation);
    }

    config::TeleopConfig config_;
    std::unique_ptr<kinematics::UrdfChainKinematics> kin_;
    std::unique_ptr<io::SimulatedArm> follower_;
    ScriptedController controller_;
    RecordingSink sink_;
    joints::JointCodec codec_;
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(ControlLoopTest, InitializeArmsGovernor) {
    auto loop = makeLoop();
    EXPECT_EQ(loop->state(), LoopState::INITIALIZING);
    EXPECT_EQ(loop->mode(), TargetMode::JOYSTICK);
    EXPECT_FALSE(loop->lastAccepted().has_value());

    ASSERT_TRUE(loop->initialize());
    EXPECT_EQ(loop->state(), LoopState::RUNNING);
    EXPECT_EQ(loop->governor().state(), safety::GovernorState::ARMED);

    JointVector q0 = initialJoints();
    ASSERT_TRUE(loop->lastAccepted().has_value());
    EXPECT_EQ(*loop->lastAccepted(), q0);

    kinematics::VectorXd v = Eigen::Map<const kinematics::VectorXd>(q0.data(), joints::NUM_JOINTS);
    kinematics::Pose expected = kin_->forwardKinematics(v, kin_->frameId("gripper_link"));
    EXPECT_TRUE(loop->targetPose().position.isApprox(expected.position, 1e-12));
}

TEST_F(ControlLoopTest, StepBeforeInitializeIsNotRunning) {
    auto loop = makeLoop();
    CycleReport report = loop->step();
    EXPECT_EQ(report.outcome, CycleOutcome::NOT_RUNNING);
    EXPECT_EQ(loop->cycleCount(), 0);
    EXPECT_EQ(controller_.polls, 0);
}

TEST_F(ControlLoopTest, UnknownFrameHaltsAtInitialize) {
    config_.model.frame = "tool0";
    auto loop = makeLoop();
    EXPECT_FALSE(loop->initialize());
    EXPECT_EQ(loop->state(), LoopState::HALTED);
    EXPECT_EQ(loop->haltReason(), FaultCode::UNKNOWN_FRAME);
    EXPECT_NE(loop->haltDetail().find("tool0"), std::string::npos);
}

TEST_F(ControlLoopTest, DisconnectedFollowerHaltsAtInitialize) {
    follower_->setConnected(false);
    auto loop = makeLoop();
    EXPECT_FALSE(loop->initialize());
    EXPECT_EQ(loop->haltReason(), FaultCode::OBSERVATION_UNAVAILABLE);

    CycleReport report = loop->step();
    EXPECT_EQ(report.outcome, CycleOutcome::HALTED);
    EXPECT_EQ(report.fault, FaultCode::OBSERVATION_UNAVAILABLE);
}

TEST_F(ControlLoopTest, IncompleteFollowerObservationHalts) {
    config_.simulation.initial_observation.erase("elbow_flex.pos");
    follower_ = std::make_unique<io::SimulatedArm>(config_.simulation.initial_observation);
    auto loop = makeLoop();
    EXPECT_FALSE(loop->initialize());
    EXPECT_EQ(loop->haltReason(), FaultCode::OBSERVATION_INCOMPLETE);
}

TEST_F(ControlLoopTest, MissingInputForModeThrows) {
    EXPECT_THROW(std::make_unique<ControlLoop>(config_, *kin_, *follower_, sink_, nullptr),
                 std::invalid_argument);

    config_.control.mode = "leader";
    EXPECT_THROW(std::make_unique<ControlLoop>(config_, *kin_, *follower_, sink_, &controller_, nullptr),
                 std::invalid_argument);
}

// ============================================================================
// Joystick cycles
// ============================================================================

TEST_F(ControlLoopTest, ZeroAxesHoldPosition) {
    controller_.push(0.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();

    ASSERT_EQ(report.outcome, CycleOutcome::ACCEPTED);
    EXPECT_EQ(report.cycle, 0);
    EXPECT_EQ(loop->cycleCount(), 1);
    EXPECT_EQ(loop->acceptedCount(), 1);
    ASSERT_TRUE(report.ik.has_value());
    EXPECT_TRUE(report.ik->converged);
    EXPECT_EQ(report.ik->iterations, 0);

    ASSERT_EQ(sink_.commands.size(), 1u);
    const JointValueMap& command = sink_.commands.front();
    for (const auto& [key, value] : config_.simulation.initial_observation) {
        if (key == "gripper.pos") continue;
        EXPECT_NEAR(command.at(key), value, 1e-6) << key;
    }
    // Released trigger (-1) closes the gripper
    EXPECT_DOUBLE_EQ(command.at("gripper.pos"), 0.0);
    EXPECT_EQ(command.count(joints::LED_CHANNEL), 0u);
}

TEST_F(ControlLoopTest, GripperAxisMapsToDeviceValue) {
    controller_.push(0.0, 0.0, 0.0, 0.0, 0.5);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();
    ASSERT_TRUE(report.command.has_value());
    EXPECT_DOUBLE_EQ(report.command->at("gripper.pos"), 75.0);
}

TEST_F(ControlLoopTest, GripperFollowsJointsWhenAxisDisabled) {
    config_.gripper.from_controller_axis = false;
    controller_.push(0.0, 0.0, 0.0, 0.0, 1.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();
    ASSERT_TRUE(report.command.has_value());
    EXPECT_NEAR(report.command->at("gripper.pos"), 100.0, 1e-6);
}

TEST_F(ControlLoopTest, LedIntensityIsForwarded) {
    config_.led_intensity = 40.0;
    controller_.push(0.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();
    ASSERT_TRUE(report.command.has_value());
    EXPECT_DOUBLE_EQ(report.command->at(joints::LED_CHANNEL), 40.0);
}

TEST_F(ControlLoopTest, StickMotionMovesTarget) {
    controller_.push(1.0);
    controller_.push(0.0, -1.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());
    const kinematics::Vector3d start = loop->targetPose().position;
    const JointVector q0 = *loop->lastAccepted();

    CycleReport first = loop->step();
    ASSERT_EQ(first.outcome, CycleOutcome::ACCEPTED) << first.detail;
    EXPECT_TRUE(first.ik->converged);
    EXPECT_NEAR(loop->targetPose().position.x(), start.x() + 0.01, 1e-12);
    EXPECT_NE(*loop->lastAccepted(), q0);

    CycleReport second = loop->step();
    ASSERT_EQ(second.outcome, CycleOutcome::ACCEPTED) << second.detail;
    EXPECT_NEAR(loop->targetPose().position.z(), start.z() + 0.01, 1e-12);

    // Reached pose tracks the accumulated target
    const JointVector q = *loop->lastAccepted();
    kinematics::VectorXd v = Eigen::Map<const kinematics::VectorXd>(q.data(), joints::NUM_JOINTS);
    kinematics::Pose reached = kin_->forwardKinematics(v, kin_->frameId("gripper_link"));
    EXPECT_LT((reached.position - loop->targetPose().position).norm(), 1e-3);
}

TEST_F(ControlLoopTest, SafetyTripSendsHoldAndHalts) {
    config_.safety.max_joint_step_rad = 1e-3;
    controller_.push(1.0);
    controller_.push(0.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();

    EXPECT_EQ(report.outcome, CycleOutcome::HALTED);
    EXPECT_EQ(report.fault, FaultCode::SAFETY_VIOLATION);
    EXPECT_EQ(loop->state(), LoopState::HALTED);
    EXPECT_TRUE(loop->governor().isTripped());
    EXPECT_EQ(loop->acceptedCount(), 0);

    // Only the hold command reached the arm, and it repeats the start position
    ASSERT_EQ(sink_.commands.size(), 1u);
    for (const auto& [key, value] : config_.simulation.initial_observation) {
        EXPECT_NEAR(sink_.commands[0].at(key), value, 1e-6) << key;
    }

    CycleReport after = loop->step();
    EXPECT_EQ(after.outcome, CycleOutcome::HALTED);
    EXPECT_EQ(after.fault, FaultCode::SAFETY_VIOLATION);
    EXPECT_EQ(controller_.polls, 1);
}

TEST_F(ControlLoopTest, HoldRepeatsLastDeliveredGripper) {
    config_.safety.max_joint_step_rad = 1e-3;
    config_.simulation.initial_observation["gripper.pos"] = 100.0;
    follower_ = std::make_unique<io::SimulatedArm>(config_.simulation.initial_observation);
    controller_.push(0.0);
    controller_.push(0.0);
    controller_.push(1.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    ASSERT_EQ(loop->step().outcome, CycleOutcome::ACCEPTED);
    ASSERT_EQ(loop->step().outcome, CycleOutcome::ACCEPTED);
    ASSERT_EQ(sink_.commands.size(), 2u);
    const JointValueMap last = sink_.commands.back();
    EXPECT_DOUBLE_EQ(last.at("gripper.pos"), 0.0);

    EXPECT_EQ(loop->step().fault, FaultCode::SAFETY_VIOLATION);
    ASSERT_EQ(sink_.commands.size(), 3u);
    const JointValueMap& hold = sink_.commands.back();
    EXPECT_DOUBLE_EQ(hold.at("gripper.pos"), last.at("gripper.pos"));
    EXPECT_EQ(hold, last);
}

TEST_F(ControlLoopTest, FaultHaltHoldKeepsTriggerGripper) {
    controller_.push(0.0, 0.0, 0.0, 0.0, 0.5);
    controller_.pushMissing();
    controller_.pushMissing();
    controller_.pushMissing();
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    ASSERT_EQ(loop->step().outcome, CycleOutcome::ACCEPTED);
    loop->step();
    loop->step();
    EXPECT_EQ(loop->step().outcome, CycleOutcome::HALTED);

    ASSERT_EQ(sink_.commands.size(), 2u);
    EXPECT_DOUBLE_EQ(sink_.commands[1].at("gripper.pos"), 75.0);
    ASSERT_TRUE(loop->lastCommand().has_value());
    EXPECT_EQ(sink_.commands[1], *loop->lastCommand());
}

TEST_F(ControlLoopTest, SafetyTripWithoutHoldPolicy) {
    config_.safety.max_joint_step_rad = 1e-3;
    config_.safety.hold_last_safe_on_halt = false;
    controller_.push(1.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    EXPECT_EQ(loop->step().fault, FaultCode::SAFETY_VIOLATION);
    EXPECT_TRUE(sink_.commands.empty());
}

TEST_F(ControlLoopTest, NonConvergenceHaltsWhenConfigured) {
    config_.integrator.translation_speed = 1.0;
    config_.safety.halt_on_non_convergence = true;
    controller_.push(1.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();
    EXPECT_EQ(report.outcome, CycleOutcome::HALTED);
    EXPECT_EQ(report.fault, FaultCode::IK_NOT_CONVERGED);
    ASSERT_TRUE(report.ik.has_value());
    EXPECT_FALSE(report.ik->converged);
    EXPECT_TRUE(sink_.commands.empty());
}

TEST_F(ControlLoopTest, EndOfInputHalts) {
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();
    EXPECT_EQ(report.outcome, CycleOutcome::HALTED);
    EXPECT_EQ(report.fault, FaultCode::END_OF_INPUT);
    EXPECT_EQ(loop->haltReason(), FaultCode::END_OF_INPUT);
}

TEST_F(ControlLoopTest, RequestStopHaltsNextCycle) {
    controller_.push(0.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    loop->requestStop();
    CycleReport report = loop->step();
    EXPECT_EQ(report.outcome, CycleOutcome::HALTED);
    EXPECT_EQ(report.fault, FaultCode::INTERRUPTED);
    EXPECT_EQ(controller_.polls, 0);
    EXPECT_TRUE(sink_.commands.empty());
}

// ============================================================================
// Fault accounting
// ============================================================================

TEST_F(ControlLoopTest, ConsecutiveFaultsHaltAtLimit) {
    controller_.pushMissing();
    controller_.pushMissing();
    controller_.pushMissing();
    controller_.push(0.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport r1 = loop->step();
    EXPECT_EQ(r1.outcome, CycleOutcome::SKIPPED);
    EXPECT_EQ(r1.fault, FaultCode::CONTROLLER_UNAVAILABLE);
    EXPECT_EQ(loop->consecutiveFaults(), 1);

    EXPECT_EQ(loop->step().outcome, CycleOutcome::SKIPPED);
    EXPECT_EQ(loop->consecutiveFaults(), 2);

    CycleReport r3 = loop->step();
    EXPECT_EQ(r3.outcome, CycleOutcome::HALTED);
    EXPECT_EQ(r3.fault, FaultCode::CONTROLLER_UNAVAILABLE);
    EXPECT_EQ(loop->state(), LoopState::HALTED);

    // Hold command on the fault halt
    EXPECT_EQ(sink_.commands.size(), 1u);
}

TEST_F(ControlLoopTest, AcceptedCycleResetsFaultCount) {
    controller_.pushMissing();
    controller_.pushMissing();
    controller_.push(0.0);
    controller_.pushMissing();
    controller_.push(0.0);
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    loop->step();
    loop->step();
    EXPECT_EQ(loop->consecutiveFaults(), 2);
    EXPECT_EQ(loop->step().outcome, CycleOutcome::ACCEPTED);
    EXPECT_EQ(loop->consecutiveFaults(), 0);
    loop->step();
    EXPECT_EQ(loop->consecutiveFaults(), 1);
    EXPECT_EQ(loop->state(), LoopState::RUNNING);
}

TEST_F(ControlLoopTest, RefusedCommandIsNotCommitted) {
    controller_.push(1.0);
    sink_.accept = false;
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());
    const JointVector q0 = *loop->lastAccepted();
    const kinematics::Vector3d start = loop->targetPose().position;

    CycleReport report = loop->step();
    EXPECT_EQ(report.outcome, CycleOutcome::SKIPPED);
    EXPECT_EQ(report.fault, FaultCode::COMMAND_REJECTED);
    EXPECT_EQ(*loop->lastAccepted(), q0);
    EXPECT_TRUE(loop->targetPose().position == start);
    EXPECT_EQ(loop->acceptedCount(), 0);
}

TEST_F(ControlLoopTest, SlowSinkCountsTimeoutButKeepsCommand) {
    config_.control.io_timeout_ms = 2;
    io::SimulatedArm slowSink(config_.simulation.initial_observation);
    slowSink.setLatency(std::chrono::milliseconds(20));
    controller_.push(0.0);

    ControlLoop loop(config_, *kin_, *follower_, slowSink, &controller_);
    ASSERT_TRUE(loop.initialize());

    CycleReport report = loop.step();
    EXPECT_EQ(report.outcome, CycleOutcome::ACCEPTED);
    EXPECT_EQ(report.fault, FaultCode::IO_TIMEOUT);
    EXPECT_EQ(loop.consecutiveFaults(), 1);
    EXPECT_EQ(loop.acceptedCount(), 1);
    EXPECT_EQ(slowSink.commandCount(), 1);
}

TEST_F(ControlLoopTest, StalledControllerCountsTimeout) {
    controller_.push(0.0);
    controller_.stalls = {1, 3};
    auto loop = makeLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport r1 = loop->step();
    EXPECT_EQ(r1.outcome, CycleOutcome::SKIPPED);
    EXPECT_EQ(r1.fault, FaultCode::IO_TIMEOUT);
    EXPECT_EQ(loop->consecutiveFaults(), 1);

    EXPECT_EQ(loop->step().outcome, CycleOutcome::ACCEPTED);
    EXPECT_EQ(loop->consecutiveFaults(), 0);

    EXPECT_EQ(loop->step().fault, FaultCode::IO_TIMEOUT);
    EXPECT_EQ(loop->state(), LoopState::RUNNING);
    EXPECT_EQ(loop->step().fault, FaultCode::END_OF_INPUT);
}

TEST_F(ControlLoopTest, NumericalFailureSkipsWithoutCounting) {
    BrokenJacobianProvider broken;
    controller_.push(1.0);
    controller_.push(1.0);
    ControlLoop loop(config_, broken, *follower_, sink_, &controller_);
    ASSERT_TRUE(loop.initialize());

    CycleReport report = loop.step();
    EXPECT_EQ(report.outcome, CycleOutcome::SKIPPED);
    EXPECT_EQ(report.fault, FaultCode::IK_NUMERICAL);
    EXPECT_EQ(loop.consecutiveFaults(), 0);
    EXPECT_EQ(loop.step().fault, FaultCode::IK_NUMERICAL);
    EXPECT_EQ(loop.state(), LoopState::RUNNING);
}

// ============================================================================
// Leader mode
// ============================================================================

class LeaderModeTest : public ControlLoopTest {
protected:
    void SetUp() override {
        ControlLoopTest::SetUp();
        config_.control.mode = "leader";
        config_.ik.max_iterations = 50;
    }

    std::unique_ptr<ControlLoop> makeLeaderLoop() {
        return std::make_unique<ControlLoop>(config_, *kin_, *follower_, sink_, nullptr, &leader_);
    }

    ScriptedLeader leader_;
};

TEST_F(LeaderModeTest, FollowerTracksLeaderJoints) {
    JointValueMap leaderObs = {
        {"shoulder_pan.pos", 5.0},
        {"shoulder_lift.pos", -5.0},
        {"elbow_flex.pos", 5.0},
        {"wrist_flex.pos", 5.0},
        {"wrist_roll.pos", 3.0},
        {"gripper.pos", 60.0},
    };
    leader_.script.push_back(leaderObs);
    auto loop = makeLeaderLoop();
    ASSERT_TRUE(loop->initialize());
    EXPECT_EQ(loop->mode(), TargetMode::LEADER);

    CycleReport report = loop->step();
    ASSERT_EQ(report.outcome, CycleOutcome::ACCEPTED) << report.detail;
    ASSERT_TRUE(report.command.has_value());

    for (const auto& [key, value] : leaderObs) {
        EXPECT_NEAR(report.command->at(key), value, 0.5) << key;
    }
    // The gripper passes straight through the seed
    EXPECT_NEAR(report.command->at("gripper.pos"), 60.0, 1e-6);
}

TEST_F(LeaderModeTest, IncompleteLeaderObservationSkips) {
    leader_.script.push_back(JointValueMap{{"shoulder_pan.pos", 0.0}});
    auto loop = makeLeaderLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();
    EXPECT_EQ(report.outcome, CycleOutcome::SKIPPED);
    EXPECT_EQ(report.fault, FaultCode::OBSERVATION_INCOMPLETE);
    EXPECT_EQ(loop->consecutiveFaults(), 0);
}

TEST_F(LeaderModeTest, UnreadableLeaderCountsFault) {
    leader_.script.push_back(std::nullopt);
    leader_.script.push_back(std::nullopt);
    auto loop = makeLeaderLoop();
    ASSERT_TRUE(loop->initialize());

    CycleReport report = loop->step();
    EXPECT_EQ(report.fault, FaultCode::OBSERVATION_UNAVAILABLE);
    EXPECT_EQ(loop->consecutiveFaults(), 1);
}

TEST_F(LeaderModeTest, ExhaustedLeaderHalts) {
    auto loop = makeLeaderLoop();
    ASSERT_TRUE(loop->initialize());
    EXPECT_EQ(loop->step().fault, FaultCode::END_OF_INPUT);
}

// ============================================================================
// Run loop and loopback arm
// ============================================================================

TEST_F(ControlLoopTest, RunUntilInputExhausted) {
    controller_.push(0.0);
    controller_.push(0.5);
    controller_.push(0.0, 0.5);
    auto loop = makeLoop();
    std::atomic<bool> running{true};

    loop->run(running);

    EXPECT_EQ(loop->state(), LoopState::HALTED);
    EXPECT_EQ(loop->haltReason(), FaultCode::END_OF_INPUT);
    EXPECT_EQ(loop->acceptedCount(), 3);
    EXPECT_EQ(loop->cycleCount(), 4);
    EXPECT_EQ(sink_.commands.size(), 3u);
}

TEST_F(ControlLoopTest, RunHonorsClearedFlag) {
    controller_.push(0.0);
    auto loop = makeLoop();
    std::atomic<bool> running{false};

    loop->run(running);

    EXPECT_EQ(loop->haltReason(), FaultCode::INTERRUPTED);
    EXPECT_EQ(loop->acceptedCount(), 0);
}

TEST_F(ControlLoopTest, SimulatedArmLoopsCommandsBack) {
    io::SimulatedArm arm(config_.simulation.initial_observation);
    JointValueMap command = {{"elbow_flex.pos", 12.0}, {"led.intensity", 30.0}, {"note", 1.0}};

    ASSERT_TRUE(arm.sendCommand(command));
    auto obs = arm.readObservation();
    ASSERT_TRUE(obs.has_value());
    EXPECT_DOUBLE_EQ(obs->at("elbow_flex.pos"), 12.0);
    EXPECT_DOUBLE_EQ(obs->at("led.intensity"), 30.0);
    EXPECT_EQ(obs->count("note"), 0u);
    EXPECT_EQ(arm.commandCount(), 1);

    arm.setConnected(false);
    EXPECT_FALSE(arm.readObservation().has_value());
    EXPECT_FALSE(arm.sendCommand(command));
    EXPECT_EQ(arm.commandCount(), 1);
}
