#ifndef ANALYTICS_ENGINE_HPP
#define ANALYTICS_ENGINE_HPP

#include "aggregation_scheduler.hpp"
#include "aggregator.hpp"
#include "analytics_types.hpp"
#include "anomaly_detector.hpp"
#include "baseline_store.hpp"
#include "core/config.hpp"
#include "engine_metrics.hpp"
#include "event_channel.hpp"
#include "moving_average_tracker.hpp"
#include "query_facade.hpp"
#include "sample_buffer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace prometheus {
class PrometheusMetricsExporter;
}

namespace storage {
class IStorageBackend;
}

namespace analytics {

enum class EngineState { CREATED, RUNNING, STOPPING, STOPPED };

const char *engine_state_to_string(EngineState state);

struct EngineStats {
  uint64_t samples_recorded = 0;
  uint64_t samples_rejected = 0;
  uint64_t rejected_invalid_value = 0;
  uint64_t rejected_empty_name = 0;
  uint64_t rejected_not_running = 0;
  uint64_t anomalies_detected = 0;
  uint64_t aggregations = 0;
  uint64_t samples_aggregated = 0;
  uint64_t persist_failures = 0;
  uint64_t periodic_passes = 0;
  uint64_t overflow_aggregations = 0;
  size_t pending_samples = 0;
  size_t tracked_keys = 0;
  size_t baseline_keys = 0;
};

/**
 * In-process metrics analytics engine.
 *
 * record_metric() is the hot path: it buffers the sample, updates the
 * moving-average windows and checks the value against the key's baseline,
 * touching only in-memory state under per-key locks. A background scheduler
 * drains the buffers into aggregations, persists them and folds them into
 * the baselines.
 *
 * Lifecycle: CREATED -> start() -> RUNNING -> shutdown() -> STOPPED.
 * Samples are accepted only while RUNNING. A stopped engine cannot be
 * restarted; build a new one against the same storage instead.
 *
 * Event callbacks must not call shutdown(): aggregation events are
 * published from the scheduler thread that shutdown() joins, and errors
 * raised during start() are published on the thread shutdown() would
 * wait for.
 */
class AnalyticsEngine {
public:
  // Throws std::invalid_argument for invalid engine or anomaly settings or a
  // null backend.
  AnalyticsEngine(const Config::AppConfig &config,
                  std::shared_ptr<storage::IStorageBackend> storage);
  ~AnalyticsEngine();

  AnalyticsEngine(const AnalyticsEngine &) = delete;
  AnalyticsEngine &operator=(const AnalyticsEngine &) = delete;

  // Opens storage (StorageError propagates), loads baselines and starts the
  // scheduler. A failed baseline load is reported and the engine starts
  // with empty baselines.
  void start();

  // Returns false when the sample was dropped. Never throws for bad input.
  bool record_metric(const std::string &name, double value,
                     const Tags &tags = {},
                     std::optional<uint64_t> timestamp_ms = std::nullopt);

  CurrentMetrics get_current_metrics() const;

  std::vector<HistoryRow> get_metric_history(const std::string &name,
                                             const Tags &tags,
                                             const TimeRange &range,
                                             Granularity granularity) const;

  // Aggregates one key immediately, outside the periodic schedule.
  std::optional<Aggregation> aggregate_now(const std::string &name,
                                           const Tags &tags = {});
  // Aggregates every key with pending samples; returns the count produced.
  size_t flush();

  // Stops intake, joins the scheduler, aggregates what is still buffered
  // and closes storage. Safe to call more than once. Called while start()
  // is in progress on another thread, it waits for start() to finish and
  // the engine to stop.
  void shutdown();

  std::optional<BaselineStats> get_baseline(const std::string &name,
                                            const Tags &tags = {}) const;
  EngineStats get_stats() const;
  EngineState state() const;

  void set_metrics_exporter(
      std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter);

  EventChannel &events() { return events_; }
  const Config::AppConfig &config() const { return config_; }

private:
  static Config::AppConfig validated(const Config::AppConfig &config);
  static storage::IStorageBackend &
  require_storage(const std::shared_ptr<storage::IStorageBackend> &storage);

  void reject(std::atomic<uint64_t> &reason_counter, const char *reason,
              const std::string &name);
  void load_baselines();
  // Joins the scheduler, runs the final pass and closes storage. The caller
  // has already moved the state to STOPPING.
  void stop_and_close();

  Config::AppConfig config_;
  std::shared_ptr<storage::IStorageBackend> storage_handle_;
  storage::IStorageBackend &storage_;

  EventChannel events_;
  EngineMetrics metrics_;
  SampleBuffer buffer_;
  MovingAverageTracker tracker_;
  BaselineStore baselines_;
  AnomalyDetector detector_;
  Aggregator aggregator_;
  AggregationScheduler scheduler_;
  QueryFacade query_;

  mutable std::shared_mutex lifecycle_mutex_;
  std::condition_variable_any lifecycle_cv_;
  EngineState state_ = EngineState::CREATED;
  std::atomic<bool> start_requested_{false};

  std::atomic<uint64_t> samples_recorded_{0};
  std::atomic<uint64_t> rejected_invalid_value_{0};
  std::atomic<uint64_t> rejected_empty_name_{0};
  std::atomic<uint64_t> rejected_not_running_{0};
  std::atomic<uint64_t> anomalies_detected_{0};
};

} // namespace analytics

#endif // ANALYTICS_ENGINE_HPP
