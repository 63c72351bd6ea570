/**
 * @file test_urdf_kinematics.cpp
 * @brief Eigen URDF chain kinematics tests
 */

#include <gtest/gtest.h>
#include "kinematics/UrdfChainKinematics.hpp"
#include "errors/Errors.hpp"
#include "logging/Logger.hpp"
#include "test_models.hpp"
#include <limits>
#include <memory>

using namespace arm_teleop;
using namespace arm_teleop::kinematics;

class UrdfChainKinematicsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("test_urdf_kinematics.log", "debug");
        kin_ = std::make_unique<UrdfChainKinematics>(test::syntheticArmModel());
        gripper_ = kin_->frameId("gripper_link");
    }

    static VectorXd sampleConfig() {
        VectorXd q(6);
        q << 0.3, -0.4, 0.7, 0.2, -0.5, 0.1;
        return q;
    }

    // Central differences of FK, expressed in base axes
    Jacobian numericalJacobian(const VectorXd& q, FrameId frame) const {
        const double h = 1e-6;
        Jacobian J(6, q.size());
        for (int i = 0; i < q.size(); ++i) {
            VectorXd qp = q, qm = q;
            qp[i] += h;
            qm[i] -= h;
            Pose Tp = kin_->forwardKinematics(qp, frame);
            Pose Tm = kin_->forwardKinematics(qm, frame);
            J.block<3, 1>(0, i) = (Tp.position - Tm.position) / (2.0 * h);
            J.block<3, 1>(3, i) = log3(Tp.rotation * Tm.rotation.transpose()) / (2.0 * h);
        }
        return J;
    }

    std::unique_ptr<UrdfChainKinematics> kin_;
    FrameId gripper_ = 0;
};

// ============================================================================
// Frames
// ============================================================================

TEST_F(UrdfChainKinematicsTest, ProviderMetadata) {
    EXPECT_EQ(kin_->name(), "urdf");
    EXPECT_EQ(kin_->numJoints(), 6);
    EXPECT_EQ(kin_->jointNames().front(), "shoulder_pan");
    EXPECT_EQ(kin_->jointLimits().size(), 6u);
    EXPECT_TRUE(kin_->hasFrame("jaw_link"));
    EXPECT_FALSE(kin_->hasFrame("tool0"));
}

TEST_F(UrdfChainKinematicsTest, UnknownFrameThrows) {
    EXPECT_THROW(kin_->frameId("tool0"), UnknownFrameError);
}

TEST_F(UrdfChainKinematicsTest, InvalidFrameIdThrows) {
    FrameId bogus = kin_->model().frames().size() + 3;
    EXPECT_THROW(kin_->forwardKinematics(sampleConfig(), bogus), UninitializedFrameError);
    EXPECT_THROW(kin_->jacobian(sampleConfig(), bogus, ReferenceFrame::LOCAL),
                 UninitializedFrameError);
}

TEST_F(UrdfChainKinematicsTest, NonFiniteJointsThrow) {
    VectorXd q = sampleConfig();
    q[1] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(kin_->forwardKinematics(q, gripper_), UninitializedFrameError);
}

// ============================================================================
// Forward kinematics
// ============================================================================

TEST_F(UrdfChainKinematicsTest, ZeroConfigurationPose) {
    Pose T = kin_->forwardKinematics(VectorXd::Zero(6), gripper_);
    EXPECT_NEAR(T.position.x(), 0.19, 1e-12);
    EXPECT_NEAR(T.position.y(), 0.0, 1e-12);
    EXPECT_NEAR(T.position.z(), 0.21, 1e-12);
    EXPECT_TRUE(T.rotation.isApprox(Matrix3d::Identity(), 1e-12));
}

TEST_F(UrdfChainKinematicsTest, PanRotatesAboutBaseZ) {
    VectorXd q = VectorXd::Zero(6);
    q[0] = PI / 2.0;
    Pose T = kin_->forwardKinematics(q, gripper_);
    EXPECT_NEAR(T.position.x(), 0.0, 1e-12);
    EXPECT_NEAR(T.position.y(), 0.19, 1e-12);
    EXPECT_NEAR(T.position.z(), 0.21, 1e-12);
}

TEST_F(UrdfChainKinematicsTest, BaseFrameIsIdentity) {
    FrameId base = kin_->frameId("base_link");
    Pose T = kin_->forwardKinematics(sampleConfig(), base);
    EXPECT_TRUE(T.position.isZero(0.0));
    EXPECT_TRUE(T.rotation.isIdentity(0.0));
    EXPECT_TRUE(kin_->jacobian(sampleConfig(), base, ReferenceFrame::LOCAL).isZero(0.0));
}

TEST_F(UrdfChainKinematicsTest, ShortAndLongVectorsAreConformed) {
    VectorXd q = sampleConfig();
    Pose full = kin_->forwardKinematics(q, gripper_);

    VectorXd longer(8);
    longer << q, 1.0, -1.0;
    Pose fromLonger = kin_->forwardKinematics(longer, gripper_);
    EXPECT_TRUE(fromLonger.position.isApprox(full.position, 1e-12));

    VectorXd shorter = q.head(3);
    VectorXd padded = VectorXd::Zero(6);
    padded.head(3) = shorter;
    Pose fromShorter = kin_->forwardKinematics(shorter, gripper_);
    Pose fromPadded = kin_->forwardKinematics(padded, gripper_);
    EXPECT_TRUE(fromShorter.position.isApprox(fromPadded.position, 1e-12));
}

TEST_F(UrdfChainKinematicsTest, ChainTransformsEndAtFramePose) {
    auto transforms = kin_->computeChainTransforms(sampleConfig(), gripper_);
    ASSERT_EQ(transforms.size(), 5u);
    Pose T = kin_->forwardKinematics(sampleConfig(), gripper_);
    EXPECT_TRUE(transforms.back().position.isApprox(T.position));
}

// ============================================================================
// Jacobian
// ============================================================================

TEST_F(UrdfChainKinematicsTest, WorldAlignedJacobianMatchesFiniteDifferences) {
    VectorXd q = sampleConfig();
    for (const std::string frameName : {"gripper_link", "jaw_link", "lower_arm_link"}) {
        FrameId frame = kin_->frameId(frameName);
        Jacobian J = kin_->jacobian(q, frame, ReferenceFrame::LOCAL_WORLD_ALIGNED);
        Jacobian Jn = numericalJacobian(q, frame);
        ASSERT_EQ(J.cols(), 6);
        EXPECT_LT((J - Jn).cwiseAbs().maxCoeff(), 1e-6) << frameName;
    }
}

TEST_F(UrdfChainKinematicsTest, LocalJacobianIsRotatedWorldAligned) {
    VectorXd q = sampleConfig();
    Pose T = kin_->forwardKinematics(q, gripper_);
    Jacobian Jwa = kin_->jacobian(q, gripper_, ReferenceFrame::LOCAL_WORLD_ALIGNED);
    Jacobian Jl = kin_->jacobian(q, gripper_, ReferenceFrame::LOCAL);

    Matrix3d Rt = T.rotation.transpose();
    EXPECT_TRUE(Jl.topRows<3>().isApprox(Rt * Jwa.topRows<3>(), 1e-12));
    EXPECT_TRUE(Jl.bottomRows<3>().isApprox(Rt * Jwa.bottomRows<3>(), 1e-12));
}

TEST_F(UrdfChainKinematicsTest, JointsOffThePathHaveZeroColumns) {
    Jacobian J = kin_->jacobian(sampleConfig(), gripper_, ReferenceFrame::LOCAL_WORLD_ALIGNED);
    // The jaw joint sits beyond gripper_link
    EXPECT_TRUE(J.col(5).isZero(0.0));
    EXPECT_FALSE(J.col(4).isZero(1e-9));
}
