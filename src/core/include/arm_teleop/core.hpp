#pragma once
/**
 * @file core.hpp
 * @brief Main include file for Arm Teleop Core
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/errors/Errors.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/config/UrdfParser.hpp"
#include "../../src/joints/JointCodec.hpp"
#include "../../src/kinematics/KDLKinematics.hpp"
#include "../../src/kinematics/UrdfChainKinematics.hpp"
#include "../../src/kinematics/DampedIKSolver.hpp"
#include "../../src/teleop/PoseIntegrator.hpp"
#include "../../src/safety/SafetyGovernor.hpp"
#include "../../src/control/ControlLoop.hpp"
#include "../../src/io/SimulatedArm.hpp"
#include "../../src/io/JsonLinesIO.hpp"
