#include <gtest/gtest.h>

#include <math.h>

#include "actuators/BridgeOutput.h"

TEST(BridgeOutputTest, ClampsDuty) {
  EXPECT_FLOAT_EQ(100.0f, clampDutyPercent(150.0f));
  EXPECT_FLOAT_EQ(-100.0f, clampDutyPercent(-400.0f));
  EXPECT_FLOAT_EQ(42.5f, clampDutyPercent(42.5f));
  EXPECT_FLOAT_EQ(0.0f, clampDutyPercent(NAN));
}

TEST(BridgeOutputTest, ForwardDrivesIn1) {
  BridgeOutput out = bridgeOutputFor(100.0f, 255);
  EXPECT_EQ(255, out.in1_pwm);
  EXPECT_EQ(0, out.in2_pwm);

  out = bridgeOutputFor(50.0f, 255);
  EXPECT_EQ(128, out.in1_pwm);
  EXPECT_EQ(0, out.in2_pwm);
}

TEST(BridgeOutputTest, ReverseDrivesIn2) {
  BridgeOutput out = bridgeOutputFor(-100.0f, 255);
  EXPECT_EQ(0, out.in1_pwm);
  EXPECT_EQ(255, out.in2_pwm);

  out = bridgeOutputFor(-50.0f, 255);
  EXPECT_EQ(0, out.in1_pwm);
  EXPECT_EQ(128, out.in2_pwm);
}

TEST(BridgeOutputTest, ZeroAndNanStop) {
  BridgeOutput out = bridgeOutputFor(0.0f, 255);
  EXPECT_EQ(0, out.in1_pwm);
  EXPECT_EQ(0, out.in2_pwm);

  out = bridgeOutputFor(NAN, 255);
  EXPECT_EQ(0, out.in1_pwm);
  EXPECT_EQ(0, out.in2_pwm);
}

TEST(BridgeOutputTest, SaturatesAndScales) {
  EXPECT_EQ(255, bridgeOutputFor(407.5f, 255).in1_pwm);
  EXPECT_EQ(255, bridgeOutputFor(-1.0e6f, 255).in2_pwm);
  EXPECT_EQ(33, bridgeOutputFor(33.0f, 100).in1_pwm);
}
