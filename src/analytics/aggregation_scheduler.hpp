#ifndef AGGREGATION_SCHEDULER_HPP
#define AGGREGATION_SCHEDULER_HPP

#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace storage {
class IStorageBackend;
}

namespace analytics {

class Aggregator;
class EventChannel;

struct SchedulerSettings {
  std::chrono::milliseconds aggregation_interval{5000};
  bool retention_enabled = true;
  std::chrono::seconds retention{604800};
  std::chrono::seconds retention_sweep_interval{3600};
};

/**
 * Single background worker that drives the Aggregator. Between periodic
 * deadlines it blocks on the overflow queue, so a key that crossed the
 * buffer threshold is aggregated without waiting for the next pass.
 *
 * A stopped scheduler cannot be restarted.
 */
class AggregationScheduler {
public:
  AggregationScheduler(Aggregator &aggregator, storage::IStorageBackend &storage,
                       const EventChannel &events, SchedulerSettings settings);
  ~AggregationScheduler();

  AggregationScheduler(const AggregationScheduler &) = delete;
  AggregationScheduler &operator=(const AggregationScheduler &) = delete;

  void start();
  // Joins the worker; an in-flight pass completes first. Idempotent.
  void stop();
  bool is_running() const { return running_.load(); }

  // Queues `key` for an out-of-band aggregation. Ignored once stopped.
  void request_aggregation(const std::string &key);

  // Purges persisted aggregations older than the retention period.
  size_t run_retention_sweep();

  uint64_t periodic_passes() const { return periodic_passes_.load(); }
  uint64_t overflow_aggregations() const {
    return overflow_aggregations_.load();
  }
  size_t pending_requests() const { return overflow_queue_.size(); }

private:
  void run();
  void run_guarded(const char *operation, const std::string &key,
                   const std::function<void()> &work);

  Aggregator &aggregator_;
  storage::IStorageBackend &storage_;
  const EventChannel &events_;
  SchedulerSettings settings_;

  ThreadSafeQueue<std::string> overflow_queue_;
  std::thread worker_;
  std::mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  bool started_ = false;

  std::atomic<uint64_t> periodic_passes_{0};
  std::atomic<uint64_t> overflow_aggregations_{0};
};

} // namespace analytics

#endif // AGGREGATION_SCHEDULER_HPP
