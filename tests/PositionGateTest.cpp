#include "PositionGate.hpp"
#include "TestPoses.hpp"
#include <gtest/gtest.h>

using namespace testposes;

class PositionGateTest : public ::testing::Test {
protected:
  PushupConfig cfg;
  PositionGate gate{cfg};
};

TEST_F(PositionGateTest, AcceptsPlank) {
  GateResult r = gate.check(plankFrame(0, 160.0f));
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.reason, GateReason::None);

  EXPECT_TRUE(gate.check(plankFrame(0, 80.0f)).ok);
}

TEST_F(PositionGateTest, AbsentFrameIsNoSubject) {
  GateResult r = gate.check(absentFrame(0));
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.reason, GateReason::NoSubject);
}

TEST_F(PositionGateTest, MissingHipsIsIncomplete) {
  GateResult r = gate.check(hiddenHipsFrame(0, 160.0f));
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.reason, GateReason::IncompleteBody);
}

TEST_F(PositionGateTest, NeedsOneFullArm) {
  PoseFrame f = plankFrame(0, 160.0f);
  f[Joint::LeftWrist].visibility = 0.0f;
  EXPECT_TRUE(gate.check(f).ok);   // right arm still complete

  f[Joint::RightElbow].visibility = 0.0f;
  GateResult r = gate.check(f);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.reason, GateReason::IncompleteBody);
}

TEST_F(PositionGateTest, UprightTorsoIsNotHorizontal) {
  GateResult r = gate.check(standingFrame(0));
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.reason, GateReason::NotHorizontal);
}

TEST_F(PositionGateTest, RaisedHandsRejected) {
  PoseFrame f = plankFrame(0, 160.0f);
  f[Joint::LeftWrist].y = 0.20f;
  f[Joint::RightWrist].y = 0.20f;

  GateResult r = gate.check(f);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.reason, GateReason::HandsTooHigh);
}

TEST_F(PositionGateTest, HiddenWristDoesNotSkewHandHeight) {
  PoseFrame f = plankFrame(0, 160.0f);
  f[Joint::RightWrist].y = 0.0f;   // garbage coordinate from an untracked joint
  f[Joint::RightWrist].visibility = 0.1f;
  EXPECT_TRUE(gate.check(f).ok);
}

TEST_F(PositionGateTest, NearVerticalTorsoIsStanding) {
  // passes the horizontal tolerance but shoulders sit right above the hips
  PoseFrame f = plankFrame(0, 160.0f);
  f[Joint::LeftShoulder]  = kp(0.50f, 0.40f);
  f[Joint::RightShoulder] = kp(0.50f, 0.40f);
  f[Joint::LeftHip]       = kp(0.51f, 0.60f);
  f[Joint::RightHip]      = kp(0.51f, 0.60f);
  f[Joint::LeftElbow]     = kp(0.50f, 0.50f);
  f[Joint::RightElbow]    = kp(0.50f, 0.50f);
  f[Joint::LeftWrist]     = kp(0.50f, 0.60f);
  f[Joint::RightWrist]    = kp(0.50f, 0.60f);

  GateResult r = gate.check(f);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.reason, GateReason::Standing);
}

TEST_F(PositionGateTest, ThresholdsComeFromConfig) {
  PushupConfig strict;
  strict.horizontalTolerance = 0.01f;
  PositionGate g(strict);

  GateResult r = g.check(plankFrame(0, 160.0f));
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.reason, GateReason::NotHorizontal);
}

TEST(GateReasonTest, NamesAreStable) {
  EXPECT_STREQ(gateReasonName(GateReason::HandsTooHigh), "hands_too_high");
  EXPECT_STREQ(gateReasonName(GateReason::NoSubject), "no_subject");
  EXPECT_STREQ(gateReasonText(GateReason::None), "");
}
