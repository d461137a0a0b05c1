#ifndef IN_MEMORY_STORAGE_BACKEND_HPP
#define IN_MEMORY_STORAGE_BACKEND_HPP

#include "storage_backend.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace storage {

struct StoredAggregation {
  std::string metric_name;
  analytics::Tags tags;
  std::string metric_key;
  analytics::Aggregation aggregation;
};

/**
 * Process-local backend. Rows survive close()/open(), so a new engine built
 * on the same instance sees what a previous one persisted.
 *
 * The fail_next_* hooks make the next N calls throw StorageError, for
 * exercising retry and error-reporting paths.
 */
class InMemoryStorageBackend : public IStorageBackend {
public:
  // Baselines are rebuilt from aggregations that ended within the lookback;
  // 0 means no limit.
  explicit InMemoryStorageBackend(uint32_t baseline_lookback_days = 7);

  void open() override;
  void close() override;

  void persist_aggregation(const std::string &metric_name,
                           const analytics::Tags &tags,
                           const analytics::Aggregation &aggregation) override;
  BaselineEntries load_baseline_stats() override;
  std::vector<analytics::HistoryRow>
  query_history(const std::string &metric_name, const analytics::Tags &tags,
                const analytics::TimeRange &range,
                analytics::Granularity granularity) override;
  size_t purge_before(uint64_t cutoff_ms) override;

  const char *get_name() const override { return "in-memory"; }

  void fail_next_opens(size_t count);
  void fail_next_persists(size_t count);
  void fail_next_loads(size_t count);
  void fail_next_purges(size_t count);

  bool is_open() const;
  std::vector<StoredAggregation> rows() const;
  size_t row_count() const;
  size_t persist_calls() const;
  size_t load_calls() const;
  size_t open_calls() const;
  size_t close_calls() const;

private:
  // Consumes one injected failure; caller holds mutex_.
  static void maybe_fail(size_t &remaining, const char *operation);
  void require_open(const char *operation) const;

  uint32_t baseline_lookback_days_;

  mutable std::mutex mutex_;
  std::vector<StoredAggregation> rows_;
  bool open_ = false;

  size_t fail_opens_ = 0;
  size_t fail_persists_ = 0;
  size_t fail_loads_ = 0;
  size_t fail_purges_ = 0;

  size_t persist_calls_ = 0;
  size_t load_calls_ = 0;
  size_t open_calls_ = 0;
  size_t close_calls_ = 0;
};

} // namespace storage

#endif // IN_MEMORY_STORAGE_BACKEND_HPP
