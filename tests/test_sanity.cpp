#include "analytics/analytics_types.hpp"
#include <gtest/gtest.h>

// Guards the string forms that end up in anomaly files and metric labels
TEST(FrameworkSanityCheck, EnumStringForms) {
  EXPECT_STREQ(analytics::severity_to_string(analytics::AnomalySeverity::MEDIUM),
               "medium");
  EXPECT_STREQ(analytics::severity_to_string(analytics::AnomalySeverity::HIGH),
               "high");
  EXPECT_STREQ(analytics::trigger_to_string(
                   analytics::AggregationTrigger::BUFFER_OVERFLOW),
               "overflow");
  EXPECT_STREQ(analytics::trigger_to_string(analytics::AggregationTrigger::SHUTDOWN),
               "shutdown");
}

TEST(FrameworkSanityCheck, GranularityParsing) {
  EXPECT_EQ(analytics::granularity_from_string("Hour"),
            analytics::Granularity::HOUR);
  EXPECT_EQ(analytics::granularity_from_string("daily"),
            analytics::Granularity::DAY);
  EXPECT_FALSE(analytics::granularity_from_string("week").has_value());
  EXPECT_EQ(analytics::granularity_to_ms(analytics::Granularity::MINUTE), 60000u);
  EXPECT_EQ(analytics::granularity_to_ms(analytics::Granularity::DAY), 86400000u);
}

TEST(FrameworkSanityCheck, MakeBaselineKeepsMoments) {
  auto baseline = analytics::make_baseline(10, 5.0, 2.0);
  EXPECT_EQ(baseline.count, 10u);
  EXPECT_DOUBLE_EQ(baseline.sum, 50.0);
  EXPECT_DOUBLE_EQ(baseline.m2, 40.0);
  EXPECT_DOUBLE_EQ(baseline.sum_squares, 290.0);
}
