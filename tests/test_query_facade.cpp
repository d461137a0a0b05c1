#include "analytics/query_facade.hpp"
#include "analytics/statistics.hpp"
#include "storage/in_memory_storage_backend.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace analytics;

class QueryFacadeTest : public ::testing::Test {
protected:
  void SetUp() override {
    backend.open();
    persist("latency", {{"host", "a"}, {"region", "eu"}}, {10, 20}, 30000);
    persist("latency", {{"host", "b"}, {"region", "eu"}}, {30, 40}, 50000);
    persist("latency", {{"host", "a"}, {"region", "eu"}}, {50}, 90000);
    persist("errors", {{"host", "a"}}, {1}, 30000);
  }

  void persist(const std::string &name, const Tags &tags,
               const std::vector<double> &values, uint64_t end_ms) {
    std::vector<Sample> samples;
    for (double value : values)
      samples.push_back({value, end_ms});
    backend.persist_aggregation(name, tags, compute_aggregation(samples));
  }

  storage::InMemoryStorageBackend backend{0};
  QueryFacade facade{backend};
};

TEST_F(QueryFacadeTest, RejectsInvalidArguments) {
  EXPECT_THROW(facade.get_metric_history("", {}, {0, 100}, Granularity::MINUTE),
               std::invalid_argument);
  EXPECT_THROW(facade.get_metric_history("latency", {}, {200, 100}, Granularity::MINUTE),
               std::invalid_argument);
}

TEST_F(QueryFacadeTest, EmptyTagFilterMatchesAllSeries) {
  auto rows = facade.get_metric_history("latency", {}, {0, 100000}, Granularity::MINUTE);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].bucket_start_ms, 0u);
  EXPECT_EQ(rows[0].count, 4u);
  EXPECT_DOUBLE_EQ(rows[0].avg, 25.0);
  EXPECT_EQ(rows[1].bucket_start_ms, 60000u);
  EXPECT_EQ(rows[1].count, 1u);
}

TEST_F(QueryFacadeTest, TagFilterIsSubsetMatch) {
  auto rows = facade.get_metric_history("latency", {{"host", "a"}}, {0, 100000},
                                        Granularity::HOUR);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].count, 3u);
  EXPECT_DOUBLE_EQ(rows[0].max, 50.0);
  EXPECT_DOUBLE_EQ(rows[0].last, 50.0);

  EXPECT_TRUE(facade.get_metric_history("latency", {{"host", "c"}}, {0, 100000},
                                        Granularity::HOUR).empty());
}

TEST_F(QueryFacadeTest, TimeRangeIsInclusiveOnEndTime) {
  auto rows = facade.get_metric_history("latency", {}, {50000, 50000}, Granularity::MINUTE);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].count, 2u);
  EXPECT_DOUBLE_EQ(rows[0].avg, 35.0);
}

TEST_F(QueryFacadeTest, StorageErrorsPropagate) {
  backend.close();
  EXPECT_THROW(facade.get_metric_history("latency", {}, {0, 100}, Granularity::DAY),
               storage::StorageError);
}
