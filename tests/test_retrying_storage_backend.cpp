#include "analytics/statistics.hpp"
#include "storage/in_memory_storage_backend.hpp"
#include "storage/retrying_storage_backend.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace storage;

class RetryingStorageBackendTest : public ::testing::Test {
protected:
  void SetUp() override {
    config.max_retries = 2;
    config.base_delay = std::chrono::milliseconds(10);
    config.max_delay = std::chrono::milliseconds(40);
    inner = std::make_shared<InMemoryStorageBackend>(0);
    backend = std::make_unique<RetryingStorageBackend>(
        inner, config,
        [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); });
  }

  analytics::Aggregation sample_aggregation() {
    return analytics::compute_aggregation({{1.0, 1000}, {3.0, 2000}});
  }

  error_recovery::RecoveryConfig config;
  std::shared_ptr<InMemoryStorageBackend> inner;
  std::unique_ptr<RetryingStorageBackend> backend;
  std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(RetryingStorageBackendTest, NullInnerIsRejected) {
  EXPECT_THROW(RetryingStorageBackend(nullptr, config), std::invalid_argument);
}

TEST_F(RetryingStorageBackendTest, NameWrapsInner) {
  EXPECT_STREQ(backend->get_name(), "retrying(in-memory)");
}

TEST_F(RetryingStorageBackendTest, TransientPersistFailureIsRetried) {
  backend->open();
  inner->fail_next_persists(2);

  EXPECT_NO_THROW(backend->persist_aggregation("cpu", {}, sample_aggregation()));
  EXPECT_EQ(inner->row_count(), 1u);
  EXPECT_EQ(inner->persist_calls(), 3u);
  ASSERT_EQ(sleeps.size(), 2u);
  EXPECT_EQ(sleeps[0], std::chrono::milliseconds(10));
  EXPECT_EQ(sleeps[1], std::chrono::milliseconds(20));
  EXPECT_EQ(backend->get_retry_stats().successful_recoveries, 1u);
}

TEST_F(RetryingStorageBackendTest, ExhaustedRetriesRethrow) {
  backend->open();
  inner->fail_next_persists(5);

  EXPECT_THROW(backend->persist_aggregation("cpu", {}, sample_aggregation()),
               StorageError);
  EXPECT_EQ(inner->persist_calls(), 3u);
  EXPECT_EQ(inner->row_count(), 0u);
  EXPECT_EQ(backend->get_retry_stats().failed_recoveries, 1u);
}

TEST_F(RetryingStorageBackendTest, OpenAndLoadAreRetried) {
  inner->fail_next_opens(1);
  backend->open();
  EXPECT_TRUE(inner->is_open());

  backend->persist_aggregation("cpu", {}, sample_aggregation());
  inner->fail_next_loads(2);
  auto entries = backend->load_baseline_stats();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(inner->load_calls(), 3u);
}

TEST_F(RetryingStorageBackendTest, PurgeIsRetried) {
  backend->open();
  backend->persist_aggregation("cpu", {}, sample_aggregation());
  inner->fail_next_purges(1);
  EXPECT_EQ(backend->purge_before(5000), 1u);
}

TEST_F(RetryingStorageBackendTest, QueryPassesThroughWithoutRetry) {
  EXPECT_THROW(backend->query_history("cpu", {}, {0, 10}, analytics::Granularity::MINUTE),
               StorageError);
  EXPECT_TRUE(sleeps.empty());
  backend->close();
  EXPECT_EQ(inner->close_calls(), 1u);
}
