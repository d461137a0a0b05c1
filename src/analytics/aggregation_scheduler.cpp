#include "aggregation_scheduler.hpp"
#include "aggregator.hpp"
#include "analytics_types.hpp"
#include "core/logger.hpp"
#include "event_channel.hpp"
#include "storage/storage_backend.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace analytics {

AggregationScheduler::AggregationScheduler(Aggregator &aggregator,
                                           storage::IStorageBackend &storage,
                                           const EventChannel &events,
                                           SchedulerSettings settings)
    : aggregator_(aggregator), storage_(storage), events_(events),
      settings_(settings) {
  if (settings_.aggregation_interval.count() <= 0)
    throw std::invalid_argument("Aggregation interval must be positive");
  if (settings_.retention_enabled &&
      (settings_.retention.count() <= 0 ||
       settings_.retention_sweep_interval.count() <= 0))
    throw std::invalid_argument(
        "Retention period and sweep interval must be positive");
}

AggregationScheduler::~AggregationScheduler() { stop(); }

void AggregationScheduler::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_)
    throw std::logic_error("Aggregation scheduler can only be started once");
  started_ = true;

  running_.store(true);
  worker_ = std::thread(&AggregationScheduler::run, this);
  LOG(LogLevel::INFO, LogComponent::ENGINE_SCHEDULER,
      "Scheduler started (interval="
          << settings_.aggregation_interval.count() << "ms, retention="
          << (settings_.retention_enabled
                  ? std::to_string(settings_.retention.count()) + "s"
                  : std::string("off"))
          << ")");
}

void AggregationScheduler::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  stop_requested_.store(true);
  overflow_queue_.shutdown();
  if (worker_.joinable()) {
    worker_.join();
    LOG(LogLevel::INFO, LogComponent::ENGINE_SCHEDULER,
        "Scheduler stopped after " << periodic_passes_.load()
                                   << " periodic passes");
  }
  running_.store(false);
}

void AggregationScheduler::request_aggregation(const std::string &key) {
  if (stop_requested_.load())
    return;
  overflow_queue_.push(key);
  LOG(LogLevel::DEBUG, LogComponent::ENGINE_SCHEDULER,
      "Overflow aggregation requested for " << key);
}

size_t AggregationScheduler::run_retention_sweep() {
  const uint64_t now_ms = Utils::get_current_time_ms();
  const uint64_t retention_ms =
      static_cast<uint64_t>(settings_.retention.count()) * 1000;
  if (now_ms <= retention_ms)
    return 0;

  size_t purged = storage_.purge_before(now_ms - retention_ms);
  if (purged > 0) {
    LOG(LogLevel::INFO, LogComponent::ENGINE_SCHEDULER,
        "Retention sweep removed " << purged << " aggregations from "
                                   << storage_.get_name());
  }
  return purged;
}

void AggregationScheduler::run_guarded(const char *operation,
                                       const std::string &key,
                                       const std::function<void()> &work) {
  try {
    work();
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::ENGINE_SCHEDULER,
        operation << " failed: " << e.what());

    ErrorInfo error;
    error.component = "scheduler";
    error.operation = operation;
    error.metric_key = key;
    error.message = e.what();
    error.timestamp_ms = Utils::get_current_time_ms();
    events_.publish_error(error);
  }
}

void AggregationScheduler::run() {
  using clock = std::chrono::steady_clock;

  auto next_pass = clock::now() + settings_.aggregation_interval;
  auto next_sweep = clock::now() + settings_.retention_sweep_interval;

  while (!stop_requested_.load()) {
    auto deadline = settings_.retention_enabled
                        ? std::min(next_pass, next_sweep)
                        : next_pass;
    auto wait = std::max(clock::duration::zero(), deadline - clock::now());

    if (auto key = overflow_queue_.wait_and_pop_for(wait)) {
      run_guarded("overflow_aggregation", *key, [this, &key] {
        if (aggregator_.aggregate(*key, AggregationTrigger::BUFFER_OVERFLOW))
          overflow_aggregations_.fetch_add(1);
      });
    }

    if (stop_requested_.load())
      break;

    auto now = clock::now();
    if (now >= next_pass) {
      run_guarded("periodic_aggregation", "", [this] {
        aggregator_.aggregate_all(AggregationTrigger::PERIODIC);
      });
      periodic_passes_.fetch_add(1);
      next_pass = clock::now() + settings_.aggregation_interval;
    }

    if (settings_.retention_enabled && now >= next_sweep) {
      run_guarded("purge_before", "", [this] { run_retention_sweep(); });
      next_sweep = clock::now() + settings_.retention_sweep_interval;
    }
  }
}

} // namespace analytics
