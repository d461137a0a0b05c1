#include "analytics/baseline_store.hpp"
#include "analytics/statistics.hpp"
#include "storage/in_memory_storage_backend.hpp"
#include "utils/utils.hpp"
#include <gtest/gtest.h>

using namespace analytics;

namespace {

Aggregation aggregation_of(const std::vector<double> &values, uint64_t end_ms) {
  std::vector<Sample> samples;
  for (double value : values)
    samples.push_back({value, end_ms});
  return compute_aggregation(samples);
}

} // namespace

TEST(BaselineStoreTest, UnknownKeyHasNoBaseline) {
  BaselineStore store;
  EXPECT_FALSE(store.get("cpu:").has_value());
  EXPECT_EQ(store.size(), 0u);
}

TEST(BaselineStoreTest, FoldAccumulatesPerKey) {
  BaselineStore store;
  store.fold("cpu:", aggregation_of(std::vector<double>(10, 10.0), 1000));
  auto folded = store.fold("cpu:", aggregation_of(std::vector<double>(10, 20.0), 2000));
  store.fold("mem:", aggregation_of({1.0, 3.0}, 1000));

  EXPECT_EQ(folded.count, 20u);
  EXPECT_DOUBLE_EQ(folded.mean, 15.0);
  EXPECT_NEAR(folded.std_dev, 2.5, 1e-9);

  auto mem = store.get("mem:");
  ASSERT_TRUE(mem.has_value());
  EXPECT_DOUBLE_EQ(mem->mean, 2.0);
  EXPECT_DOUBLE_EQ(mem->std_dev, 1.0);
  EXPECT_EQ(store.size(), 2u);
}

TEST(BaselineStoreTest, UpsertReplaces) {
  BaselineStore store;
  store.upsert("cpu:", make_baseline(100, 50.0, 5.0));
  store.upsert("cpu:", make_baseline(10, 1.0, 0.5));
  EXPECT_EQ(store.get("cpu:")->count, 10u);
  EXPECT_EQ(store.snapshot().size(), 1u);
}

TEST(BaselineStoreTest, LoadReplacesCacheFromBackend) {
  storage::InMemoryStorageBackend backend(7);
  backend.open();
  uint64_t now = Utils::get_current_time_ms();
  backend.persist_aggregation("cpu", {{"host", "a"}},
                              aggregation_of({10.0, 20.0, 30.0}, now - 1000));
  backend.persist_aggregation("cpu", {{"host", "a"}},
                              aggregation_of({40.0}, now));

  BaselineStore store;
  store.upsert("stale:", make_baseline(5, 1.0, 1.0));
  EXPECT_EQ(store.load(backend), 1u);

  EXPECT_FALSE(store.get("stale:").has_value());
  auto baseline = store.get("cpu:host:a");
  ASSERT_TRUE(baseline.has_value());
  EXPECT_EQ(baseline->count, 4u);
  EXPECT_DOUBLE_EQ(baseline->mean, 25.0);
}

TEST(BaselineStoreTest, LoadFailureLeavesCacheUntouched) {
  storage::InMemoryStorageBackend backend;
  backend.open();
  backend.fail_next_loads(1);

  BaselineStore store;
  store.upsert("cpu:", make_baseline(5, 1.0, 1.0));
  EXPECT_THROW(store.load(backend), storage::StorageError);
  EXPECT_TRUE(store.get("cpu:").has_value());
}
