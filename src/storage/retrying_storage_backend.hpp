#ifndef RETRYING_STORAGE_BACKEND_HPP
#define RETRYING_STORAGE_BACKEND_HPP

#include "storage_backend.hpp"
#include "utils/error_recovery.hpp"

#include <memory>
#include <string>

namespace storage {

/**
 * Decorator that retries open, persist, baseline load and purge with
 * bounded exponential backoff. History queries and close() pass straight
 * through. The last StorageError is rethrown once retries are exhausted.
 */
class RetryingStorageBackend : public IStorageBackend {
public:
  RetryingStorageBackend(
      std::shared_ptr<IStorageBackend> inner,
      const error_recovery::RecoveryConfig &config,
      error_recovery::SleepFunction sleep = error_recovery::sleep_for_delay);

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

  const char *get_name() const override { return name_.c_str(); }

  error_recovery::RecoveryStats get_retry_stats() const {
    return executor_.get_stats();
  }
  IStorageBackend &inner() { return *inner_; }

private:
  std::shared_ptr<IStorageBackend> inner_;
  error_recovery::RetryExecutor executor_;
  std::string name_;
};

} // namespace storage

#endif // RETRYING_STORAGE_BACKEND_HPP
