#include <gtest/gtest.h>

#include "Fakes.h"
#include "HostOptions.h"
#include "Params.h"

TEST(HostOptionsTest, ParsesGain) {
  float kp = 0.0f;
  EXPECT_TRUE(parseKpOrDefault("0.06", kp));
  EXPECT_FLOAT_EQ(0.06f, kp);

  EXPECT_TRUE(parseKpOrDefault("2", kp));
  EXPECT_FLOAT_EQ(2.0f, kp);
}

TEST(HostOptionsTest, BadGainFallsBackToDefault) {
  LogCapture log;
  const char* bad[] = { "abc", "0", "-0.1", "0.05x", "", "inf", "nan" };

  for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
    float kp = 1.0f;
    EXPECT_FALSE(parseKpOrDefault(bad[i], kp)) << bad[i];
    EXPECT_FLOAT_EQ(DEFAULT_KP, kp) << bad[i];
  }

  float kp = 1.0f;
  EXPECT_FALSE(parseKpOrDefault(nullptr, kp));
  EXPECT_FLOAT_EQ(DEFAULT_KP, kp);

  EXPECT_TRUE(log.contains("using"));
}

TEST(HostOptionsTest, ParsesPeriod) {
  uint32_t period = 0;
  EXPECT_TRUE(parsePeriodOrDefault("30", period));
  EXPECT_EQ(30u, period);

  EXPECT_TRUE(parsePeriodOrDefault("1000", period));
  EXPECT_EQ(1000u, period);
}

TEST(HostOptionsTest, BadPeriodFallsBackToDefault) {
  LogCapture log;
  const char* bad[] = { "0", "1001", "12.5", "-10", "ten", "" };

  for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
    uint32_t period = 77;
    EXPECT_FALSE(parsePeriodOrDefault(bad[i], period)) << bad[i];
    EXPECT_EQ(DEFAULT_PERIOD_MS, period) << bad[i];
  }
}

TEST(HostOptionsTest, ParsesUnsigned) {
  uint32_t v = 5;
  EXPECT_TRUE(parseUnsigned("115200", v));
  EXPECT_EQ(115200u, v);

  v = 5;
  EXPECT_FALSE(parseUnsigned("-5", v));
  EXPECT_FALSE(parseUnsigned("0", v));
  EXPECT_FALSE(parseUnsigned("12a", v));
  EXPECT_FALSE(parseUnsigned(nullptr, v));
  EXPECT_EQ(5u, v);
}
