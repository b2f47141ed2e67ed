#include <gtest/gtest.h>

#include "utils/Rate.h"

TEST(RateTest, FirstCallRunsImmediately) {
  Rate r;
  r.setPeriodMs(10);

  EXPECT_TRUE(r.ready(5));
  EXPECT_FALSE(r.ready(5));
  EXPECT_FALSE(r.ready(14));
  EXPECT_TRUE(r.ready(15));
  EXPECT_EQ(25u, r.nextMs());
}

TEST(RateTest, LateActivationDoesNotShiftSchedule) {
  Rate r;
  r.setPeriodMs(10);

  ASSERT_TRUE(r.ready(0));
  EXPECT_TRUE(r.ready(12));
  EXPECT_EQ(20u, r.nextMs());
  EXPECT_FALSE(r.ready(19));
  EXPECT_TRUE(r.ready(20));
  EXPECT_EQ(0u, r.lateCount());
}

TEST(RateTest, MissedPeriodResyncsAndCounts) {
  Rate r;
  r.setPeriodMs(10);

  ASSERT_TRUE(r.ready(0));
  EXPECT_TRUE(r.ready(35));
  EXPECT_EQ(1u, r.lateCount());
  EXPECT_EQ(45u, r.nextMs());
  EXPECT_FALSE(r.ready(44));
  EXPECT_TRUE(r.ready(45));
}

TEST(RateTest, ExactlyOnePeriodLateKeepsSchedule) {
  Rate r;
  r.setPeriodMs(10);

  ASSERT_TRUE(r.ready(0));

  // Activations due at 10 and 20 both still run, back to back
  EXPECT_TRUE(r.ready(20));
  EXPECT_EQ(0u, r.lateCount());
  EXPECT_EQ(20u, r.nextMs());
  EXPECT_TRUE(r.ready(20));
  EXPECT_EQ(30u, r.nextMs());
  EXPECT_FALSE(r.ready(20));
}

TEST(RateTest, SurvivesMillisRollover) {
  Rate r;
  r.setPeriodMs(10);

  ASSERT_TRUE(r.ready(0xFFFFFFF0u));
  EXPECT_FALSE(r.ready(0xFFFFFFF9u));
  EXPECT_TRUE(r.ready(0xFFFFFFFAu));
  EXPECT_EQ(4u, r.nextMs());
  EXPECT_FALSE(r.ready(2));
  EXPECT_TRUE(r.ready(4));
  EXPECT_EQ(0u, r.lateCount());
}

TEST(RateTest, DueDoesNotConsume) {
  Rate r;
  r.setPeriodMs(10);

  EXPECT_TRUE(r.due(0));
  ASSERT_TRUE(r.ready(0));
  EXPECT_FALSE(r.due(5));
  EXPECT_TRUE(r.due(10));
  EXPECT_TRUE(r.due(10));
  EXPECT_TRUE(r.ready(10));
}

TEST(RateTest, RestartRunsOnNextCall) {
  Rate r;
  r.setPeriodMs(100);

  ASSERT_TRUE(r.ready(0));
  EXPECT_FALSE(r.ready(3));
  r.restart();
  EXPECT_TRUE(r.due(3));
  EXPECT_TRUE(r.ready(3));
  EXPECT_EQ(103u, r.nextMs());
}

TEST(RateTest, PeriodSetters) {
  Rate r;
  EXPECT_EQ(1000u, r.periodMs());

  r.setPeriodMs(25);
  EXPECT_EQ(25u, r.periodMs());

  r.setPeriodMs(0);
  EXPECT_EQ(1u, r.periodMs());
}
