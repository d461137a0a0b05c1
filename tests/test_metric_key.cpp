#include "analytics/metric_key.hpp"
#include <gtest/gtest.h>

using namespace analytics;

TEST(MetricKeyTest, TagsAreSortedByKey) {
  Tags tags{{"region", "eu"}, {"host", "web-1"}};
  EXPECT_EQ(canonical_key("cpu.usage", tags), "cpu.usage:host:web-1,region:eu");
}

TEST(MetricKeyTest, UntaggedMetricEndsWithSeparator) {
  EXPECT_EQ(canonical_key("requests", {}), "requests:");
}

TEST(MetricKeyTest, SameTagsInAnyOrderGiveSameKey) {
  Tags first;
  first["b"] = "2";
  first["a"] = "1";
  Tags second;
  second["a"] = "1";
  second["b"] = "2";
  EXPECT_EQ(canonical_key("m", first), canonical_key("m", second));
}

TEST(MetricKeyTest, SeparatorsAreEscaped) {
  Tags tags{{"path", "/a,b"}, {"port", "host:80"}};
  std::string key = canonical_key("http:latency", tags);
  EXPECT_EQ(key, "http\\:latency:path:/a\\,b,port:host\\:80");

  // Distinct inputs never collide once escaped
  EXPECT_NE(canonical_key("a", {{"b", "c,d:e"}}),
            canonical_key("a", {{"b", "c"}, {"d", "e"}}));
}

TEST(MetricKeyTest, SplitKeyInvertsCanonicalKey) {
  Tags tags{{"path", "/a,b"}, {"port", "host:80"}, {"dir", "c:\\tmp"}};
  auto [name, parsed] = split_key(canonical_key("http:latency", tags));
  EXPECT_EQ(name, "http:latency");
  EXPECT_EQ(parsed, tags);

  auto [plain_name, no_tags] = split_key("requests:");
  EXPECT_EQ(plain_name, "requests");
  EXPECT_TRUE(no_tags.empty());
}

TEST(MetricKeyTest, ParseTagsSkipsMalformedPairs) {
  Tags tags = parse_tags("host:a,broken,:nokey,zone:");
  ASSERT_EQ(tags.size(), 2u);
  EXPECT_EQ(tags.at("host"), "a");
  EXPECT_EQ(tags.at("zone"), "");
  EXPECT_TRUE(parse_tags("").empty());
}
