#include "analytics_engine.hpp"
#include "core/logger.hpp"
#include "metric_key.hpp"
#include "storage/storage_backend.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>

namespace analytics {

namespace {

SchedulerSettings scheduler_settings(const Config::EngineConfig &engine) {
  SchedulerSettings settings;
  settings.aggregation_interval =
      std::chrono::milliseconds(engine.aggregation_interval_ms);
  settings.retention_enabled = engine.retention_enabled;
  settings.retention = std::chrono::seconds(engine.retention_seconds);
  settings.retention_sweep_interval =
      std::chrono::seconds(engine.retention_sweep_interval_seconds);
  return settings;
}

} // namespace

const char *engine_state_to_string(EngineState state) {
  switch (state) {
  case EngineState::CREATED:
    return "created";
  case EngineState::RUNNING:
    return "running";
  case EngineState::STOPPING:
    return "stopping";
  case EngineState::STOPPED:
    return "stopped";
  }
  return "unknown";
}

Config::AppConfig AnalyticsEngine::validated(const Config::AppConfig &config) {
  std::vector<std::string> errors;
  Config::validate_engine_config(config.engine, errors);
  Config::validate_anomaly_config(config.anomaly, errors);
  if (!errors.empty())
    throw std::invalid_argument("Invalid engine configuration: " +
                                Utils::join_strings(errors, "; "));
  return config;
}

storage::IStorageBackend &AnalyticsEngine::require_storage(
    const std::shared_ptr<storage::IStorageBackend> &storage) {
  if (!storage)
    throw std::invalid_argument("AnalyticsEngine requires a storage backend");
  return *storage;
}

AnalyticsEngine::AnalyticsEngine(
    const Config::AppConfig &config,
    std::shared_ptr<storage::IStorageBackend> storage)
    : config_(validated(config)), storage_handle_(std::move(storage)),
      storage_(require_storage(storage_handle_)),
      buffer_(config_.engine.buffer_overflow_threshold),
      tracker_(config_.engine.window_sizes_seconds),
      detector_(baselines_, config_.anomaly.threshold,
                config_.anomaly.min_samples),
      aggregator_(buffer_, baselines_, storage_, events_, metrics_),
      scheduler_(aggregator_, storage_, events_,
                 scheduler_settings(config_.engine)),
      query_(storage_) {}

AnalyticsEngine::~AnalyticsEngine() {
  try {
    shutdown();
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "Engine shutdown during destruction failed: " << e.what());
  }
}

void AnalyticsEngine::start() {
  if (start_requested_.exchange(true))
    throw std::logic_error("AnalyticsEngine can only be started once");

  try {
    storage_.open();
  } catch (const storage::StorageError &e) {
    LOG(LogLevel::ERROR, LogComponent::STORAGE,
        "Opening " << storage_.get_name() << " failed: " << e.what());
    {
      std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
      if (state_ == EngineState::CREATED) {
        start_requested_.store(false);
      } else {
        state_ = EngineState::STOPPED;
        lifecycle_cv_.notify_all();
      }
    }
    throw;
  }
  load_baselines();
  scheduler_.start();

  bool stop_requested = false;
  {
    std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (state_ == EngineState::CREATED)
      state_ = EngineState::RUNNING;
    else
      stop_requested = true;
  }
  // A shutdown() racing with start() wins; its teardown runs here.
  if (stop_requested) {
    LOG(LogLevel::INFO, LogComponent::CORE,
        "Shutdown requested while starting");
    stop_and_close();
    return;
  }
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Analytics engine running on " << storage_.get_name() << " with "
                                     << baselines_.size() << " baselines");
}

void AnalyticsEngine::load_baselines() {
  try {
    baselines_.load(storage_);
  } catch (const storage::StorageError &e) {
    LOG(LogLevel::ERROR, LogComponent::ENGINE_BASELINE,
        "Baseline load failed, starting with empty baselines: " << e.what());

    ErrorInfo error;
    error.component = "baseline_store";
    error.operation = "load_baseline_stats";
    error.message = e.what();
    error.timestamp_ms = Utils::get_current_time_ms();
    events_.publish_error(error);
  }
}

void AnalyticsEngine::reject(std::atomic<uint64_t> &reason_counter,
                             const char *reason, const std::string &name) {
  reason_counter.fetch_add(1);
  metrics_.sample_rejected(reason);
  LOG(LogLevel::TRACE, LogComponent::ENGINE_INGEST,
      "Dropped sample for '" << name << "': " << reason);
}

bool AnalyticsEngine::record_metric(const std::string &name, double value,
                                    const Tags &tags,
                                    std::optional<uint64_t> timestamp_ms) {
  std::optional<AnomalyEvent> anomaly;
  {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (state_ != EngineState::RUNNING) {
      reject(rejected_not_running_, "not_running", name);
      return false;
    }
    if (name.empty()) {
      reject(rejected_empty_name_, "empty_name", name);
      return false;
    }
    if (!std::isfinite(value)) {
      reject(rejected_invalid_value_, "invalid_value", name);
      return false;
    }

    const std::string key = canonical_key(name, tags);
    const uint64_t ts = timestamp_ms.value_or(Utils::get_current_time_ms());

    AppendResult appended = buffer_.append(key, Sample{value, ts});
    tracker_.update(key, value, ts);
    samples_recorded_.fetch_add(1);
    metrics_.sample_recorded();

    if (config_.anomaly.enabled)
      anomaly = detector_.detect(key, name, tags, value, ts);

    if (appended.overflowed)
      scheduler_.request_aggregation(key);
    if (appended.length == 1)
      metrics_.set_tracked_keys(tracker_.tracked_keys());
  }

  // Published outside the lifecycle lock so a subscriber may record too.
  if (anomaly) {
    anomalies_detected_.fetch_add(1);
    metrics_.anomaly_detected(anomaly->severity);
    events_.publish_anomaly(*anomaly);
  }
  return true;
}

CurrentMetrics AnalyticsEngine::get_current_metrics() const {
  return tracker_.snapshot();
}

std::vector<HistoryRow>
AnalyticsEngine::get_metric_history(const std::string &name, const Tags &tags,
                                    const TimeRange &range,
                                    Granularity granularity) const {
  return query_.get_metric_history(name, tags, range, granularity);
}

std::optional<Aggregation> AnalyticsEngine::aggregate_now(const std::string &name,
                                                          const Tags &tags) {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  if (state_ != EngineState::RUNNING) {
    LOG(LogLevel::WARN, LogComponent::ENGINE_AGGREGATE,
        "aggregate_now ignored, engine is " << engine_state_to_string(state_));
    return std::nullopt;
  }
  return aggregator_.aggregate(canonical_key(name, tags),
                               AggregationTrigger::MANUAL);
}

size_t AnalyticsEngine::flush() {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  if (state_ != EngineState::RUNNING) {
    LOG(LogLevel::WARN, LogComponent::ENGINE_AGGREGATE,
        "flush ignored, engine is " << engine_state_to_string(state_));
    return 0;
  }
  return aggregator_.aggregate_all(AggregationTrigger::MANUAL);
}

void AnalyticsEngine::shutdown() {
  {
    std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
    if (state_ == EngineState::STOPPING || state_ == EngineState::STOPPED)
      return;
    if (state_ == EngineState::CREATED) {
      if (!start_requested_.load()) {
        state_ = EngineState::STOPPED;
        return;
      }
      // start() is past the gate and tears down once it sees STOPPING.
      state_ = EngineState::STOPPING;
      lifecycle_cv_.wait(lock,
                         [this] { return state_ == EngineState::STOPPED; });
      return;
    }
    // Taking the lock exclusively waited out in-flight record_metric calls.
    state_ = EngineState::STOPPING;
  }
  stop_and_close();
}

void AnalyticsEngine::stop_and_close() {
  LOG(LogLevel::INFO, LogComponent::CORE, "Analytics engine shutting down");
  scheduler_.stop();

  size_t flushed = aggregator_.aggregate_all(AggregationTrigger::SHUTDOWN);

  try {
    storage_.close();
  } catch (const storage::StorageError &e) {
    LOG(LogLevel::ERROR, LogComponent::STORAGE,
        "Closing " << storage_.get_name() << " failed: " << e.what());

    ErrorInfo error;
    error.component = "storage";
    error.operation = "close";
    error.message = e.what();
    error.timestamp_ms = Utils::get_current_time_ms();
    events_.publish_error(error);
  }

  {
    std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
    state_ = EngineState::STOPPED;
  }
  lifecycle_cv_.notify_all();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Analytics engine stopped, final pass produced " << flushed
                                                       << " aggregations");
}

std::optional<BaselineStats>
AnalyticsEngine::get_baseline(const std::string &name, const Tags &tags) const {
  return baselines_.get(canonical_key(name, tags));
}

EngineStats AnalyticsEngine::get_stats() const {
  EngineStats stats;
  stats.samples_recorded = samples_recorded_.load();
  stats.rejected_invalid_value = rejected_invalid_value_.load();
  stats.rejected_empty_name = rejected_empty_name_.load();
  stats.rejected_not_running = rejected_not_running_.load();
  stats.samples_rejected = stats.rejected_invalid_value +
                           stats.rejected_empty_name +
                           stats.rejected_not_running;
  stats.anomalies_detected = anomalies_detected_.load();

  auto aggregator_stats = aggregator_.get_stats();
  stats.aggregations = aggregator_stats.aggregations;
  stats.samples_aggregated = aggregator_stats.samples_aggregated;
  stats.persist_failures = aggregator_stats.persist_failures;
  stats.periodic_passes = scheduler_.periodic_passes();
  stats.overflow_aggregations = scheduler_.overflow_aggregations();

  stats.pending_samples = buffer_.total_pending();
  stats.tracked_keys = tracker_.tracked_keys();
  stats.baseline_keys = baselines_.size();
  return stats;
}

EngineState AnalyticsEngine::state() const {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  return state_;
}

void AnalyticsEngine::set_metrics_exporter(
    std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter) {
  metrics_.set_exporter(std::move(exporter));
  metrics_.set_tracked_keys(tracker_.tracked_keys());
}

} // namespace analytics
