#include "io/metric_readers/metric_line_parser.hpp"
#include <gtest/gtest.h>

TEST(MetricLineParserTest, NameAndValue) {
  auto line = parse_metric_line("cpu.usage 42.5");
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(line->name, "cpu.usage");
  EXPECT_DOUBLE_EQ(line->value, 42.5);
  EXPECT_TRUE(line->tags.empty());
  EXPECT_FALSE(line->timestamp_ms.has_value());
}

TEST(MetricLineParserTest, TagsAndTimestamp) {
  auto line = parse_metric_line("  http.latency\t120 host=web-1,region=eu 1700000000000  ");
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(line->name, "http.latency");
  EXPECT_DOUBLE_EQ(line->value, 120.0);
  ASSERT_EQ(line->tags.size(), 2u);
  EXPECT_EQ(line->tags.at("host"), "web-1");
  EXPECT_EQ(line->tags.at("region"), "eu");
  ASSERT_TRUE(line->timestamp_ms.has_value());
  EXPECT_EQ(*line->timestamp_ms, 1700000000000ULL);
}

TEST(MetricLineParserTest, TimestampWithoutTags) {
  auto line = parse_metric_line("queue.depth 7 1700000000123");
  ASSERT_TRUE(line.has_value());
  EXPECT_TRUE(line->tags.empty());
  EXPECT_EQ(line->timestamp_ms, 1700000000123ULL);
}

TEST(MetricLineParserTest, EmptyTagValueIsKept) {
  auto line = parse_metric_line("cpu 1 host=");
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(line->tags.at("host"), "");
}

TEST(MetricLineParserTest, BlankAndCommentLinesAreSkipped) {
  EXPECT_FALSE(parse_metric_line("").has_value());
  EXPECT_FALSE(parse_metric_line("   ").has_value());
  EXPECT_FALSE(parse_metric_line("# cpu 1").has_value());
}

TEST(MetricLineParserTest, MalformedLinesAreRejected) {
  EXPECT_FALSE(parse_metric_line("cpu").has_value());
  EXPECT_FALSE(parse_metric_line("cpu abc").has_value());
  EXPECT_FALSE(parse_metric_line("cpu inf").has_value());
  EXPECT_FALSE(parse_metric_line("cpu 1 host=a 1700 extra").has_value());
  EXPECT_FALSE(parse_metric_line("cpu 1 =a").has_value());
  EXPECT_FALSE(parse_metric_line("cpu 1 host=a,broken").has_value());
  // The timestamp has to come last
  EXPECT_FALSE(parse_metric_line("cpu 1 1700 host=a").has_value());
  EXPECT_FALSE(parse_metric_line("cpu 1 notanumber").has_value());
  // A dash marks a missing field, not a zero
  EXPECT_FALSE(parse_metric_line("cpu -").has_value());
  EXPECT_FALSE(parse_metric_line("cpu 5 -").has_value());
  EXPECT_FALSE(parse_metric_line("cpu 5 host=a -").has_value());
}
