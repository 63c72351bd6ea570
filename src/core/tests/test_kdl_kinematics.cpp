/**
 * @file test_kdl_kinematics.cpp
 * @brief KDL backend tests (cross-validated against the Eigen URDF chain)
 */

#include <gtest/gtest.h>
#include "kinematics/KDLKinematics.hpp"
#include "kinematics/UrdfChainKinematics.hpp"
#include "errors/Errors.hpp"
#include "logging/Logger.hpp"
#include "test_models.hpp"
#include <memory>
#include <limits>
#include <random>
#include <vector>

using namespace arm_teleop;
using namespace arm_teleop::kinematics;

// Test configurations
struct TestConfig {
    std::string name;
    std::vector<double> q;
};

static std::vector<TestConfig> getTestConfigs() {
    return {
        {"home",       {0, 0, 0, 0, 0, 0}},
        {"pan_90",     {PI/2, 0, 0, 0, 0, 0}},
        {"pan_neg90",  {-PI/2, 0, 0, 0, 0, 0}},
        {"lift_45",    {0, PI/4, 0, 0, 0, 0}},
        {"elbow_45",   {0, 0, PI/4, 0, 0, 0}},
        {"wrist_45",   {0, 0, 0, PI/4, 0, 0}},
        {"roll_90",    {0, 0, 0, 0, PI/2, 0}},
        {"jaw_open",   {0, 0, 0, 0, 0, -1.2}},
        {"combo",      {PI/6, PI/4, -PI/6, 0.3, 0, 0}},
        {"all_small",  {0.1, -0.2, 0.3, -0.1, 0.2, -0.3}},
        {"random_1",   {0.5, -0.3, 1.2, -0.7, 0.4, -1.1}},
        {"random_2",   {-1.0, 0.8, -0.5, 1.5, -1.5, 0.1}},
    };
}

static VectorXd toVector(const std::vector<double>& values) {
    return Eigen::Map<const VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

// ============================================================================
// FK / Jacobian Cross-Validation Tests
// ============================================================================

class KDLvsURDF : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_kdl_kinematics.log", "debug");
        KinematicModel model = test::syntheticArmModel();
        urdfKin_ = std::make_unique<UrdfChainKinematics>(model);
        kdlKin_ = std::make_unique<KDLKinematics>(model);
    }

    std::unique_ptr<UrdfChainKinematics> urdfKin_;
    std::unique_ptr<KDLKinematics> kdlKin_;
};

TEST_F(KDLvsURDF, Initialized) {
    EXPECT_TRUE(kdlKin_->isInitialized());
    EXPECT_EQ(kdlKin_->name(), "kdl");
    EXPECT_EQ(kdlKin_->numJoints(), 6);
    EXPECT_EQ(kdlKin_->jointNames(), urdfKin_->jointNames());
}

TEST_F(KDLvsURDF, FrameLookupMatches) {
    EXPECT_EQ(kdlKin_->frameId("gripper_link"), urdfKin_->frameId("gripper_link"));
    EXPECT_TRUE(kdlKin_->hasFrame("jaw_link"));
    EXPECT_THROW(kdlKin_->frameId("tool0"), UnknownFrameError);
}

TEST_F(KDLvsURDF, AllConfigs_Match) {
    for (const std::string frameName : {"gripper_link", "jaw_link", "wrist_link"}) {
        FrameId frame = urdfKin_->frameId(frameName);

        for (const auto& cfg : getTestConfigs()) {
            VectorXd q = toVector(cfg.q);
            Pose urdfPose = urdfKin_->forwardKinematics(q, frame);
            Pose kdlPose = kdlKin_->forwardKinematics(q, frame);

            double posErr = (urdfPose.position - kdlPose.position).norm();
            EXPECT_LT(posErr, 1e-9)
                << "Config: " << cfg.name << " frame: " << frameName
                << " pos URDF: (" << urdfPose.position.transpose() << ")"
                << " KDL: (" << kdlPose.position.transpose() << ")";

            Matrix3d R_err = urdfPose.rotation.transpose() * kdlPose.rotation;
            double oriErr = AngleAxisd(R_err).angle();
            EXPECT_LT(oriErr, 1e-9)
                << "Config: " << cfg.name << " frame: " << frameName
                << " ori diff: " << oriErr << " rad";
        }
    }
}

TEST_F(KDLvsURDF, JacobiansMatchInBothReferences) {
    FrameId frame = urdfKin_->frameId("gripper_link");

    for (const auto& cfg : getTestConfigs()) {
        VectorXd q = toVector(cfg.q);
        for (ReferenceFrame ref : {ReferenceFrame::LOCAL, ReferenceFrame::LOCAL_WORLD_ALIGNED}) {
            Jacobian Ju = urdfKin_->jacobian(q, frame, ref);
            Jacobian Jk = kdlKin_->jacobian(q, frame, ref);
            ASSERT_EQ(Jk.cols(), Ju.cols());
            EXPECT_LT((Ju - Jk).cwiseAbs().maxCoeff(), 1e-9)
                << "Config: " << cfg.name << " reference: " << toString(ref);
        }
    }
}

TEST_F(KDLvsURDF, RandomConfigs_Match) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dist(-1.5, 1.5);
    FrameId frame = urdfKin_->frameId("jaw_link");

    for (int trial = 0; trial < 50; ++trial) {
        VectorXd q(6);
        for (int i = 0; i < 6; ++i) q[i] = dist(rng);

        Pose urdfPose = urdfKin_->forwardKinematics(q, frame);
        Pose kdlPose = kdlKin_->forwardKinematics(q, frame);
        EXPECT_LT((urdfPose.position - kdlPose.position).norm(), 1e-9) << "trial " << trial;

        Jacobian Ju = urdfKin_->jacobian(q, frame, ReferenceFrame::LOCAL_WORLD_ALIGNED);
        Jacobian Jk = kdlKin_->jacobian(q, frame, ReferenceFrame::LOCAL_WORLD_ALIGNED);
        EXPECT_LT((Ju - Jk).cwiseAbs().maxCoeff(), 1e-9) << "trial " << trial;
    }
}

// ============================================================================
// Error paths
// ============================================================================

class KDLKinematicsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_kdl_kinematics.log", "debug");
        kdlKin_ = std::make_unique<KDLKinematics>(test::syntheticArmModel());
    }

    std::unique_ptr<KDLKinematics> kdlKin_;
};

TEST_F(KDLKinematicsTest, BaseFrameIsIdentity) {
    FrameId base = kdlKin_->frameId("base_link");
    VectorXd q = VectorXd::Constant(6, 0.4);
    Pose T = kdlKin_->forwardKinematics(q, base);
    EXPECT_TRUE(T.position.isZero(0.0));
    EXPECT_TRUE(T.rotation.isIdentity(0.0));
}

TEST_F(KDLKinematicsTest, InvalidFrameIdThrows) {
    EXPECT_THROW(kdlKin_->forwardKinematics(VectorXd::Zero(6), 99), UninitializedFrameError);
    EXPECT_THROW(kdlKin_->jacobian(VectorXd::Zero(6), 99, ReferenceFrame::LOCAL),
                 UninitializedFrameError);
}

TEST_F(KDLKinematicsTest, NonFiniteJointsThrow) {
    VectorXd q = VectorXd::Zero(6);
    q[3] = std::numeric_limits<double>::infinity();
    FrameId frame = kdlKin_->frameId("gripper_link");
    EXPECT_THROW(kdlKin_->forwardKinematics(q, frame), UninitializedFrameError);
}

TEST_F(KDLKinematicsTest, ShortVectorIsZeroPadded) {
    FrameId frame = kdlKin_->frameId("gripper_link");
    VectorXd shortQ(2);
    shortQ << 0.2, 0.3;
    VectorXd padded = VectorXd::Zero(6);
    padded.head(2) = shortQ;

    EXPECT_TRUE(kdlKin_->forwardKinematics(shortQ, frame).position.isApprox(
        kdlKin_->forwardKinematics(padded, frame).position, 1e-12));
}
