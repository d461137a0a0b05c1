#include "aggregator.hpp"
#include "baseline_store.hpp"
#include "core/logger.hpp"
#include "engine_metrics.hpp"
#include "event_channel.hpp"
#include "metric_key.hpp"
#include "sample_buffer.hpp"
#include "statistics.hpp"
#include "storage/storage_backend.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

namespace analytics {

Aggregator::Aggregator(SampleBuffer &buffer, BaselineStore &baselines,
                       storage::IStorageBackend &storage,
                       const EventChannel &events, EngineMetrics &metrics)
    : buffer_(buffer), baselines_(baselines), storage_(storage),
      events_(events), metrics_(metrics) {}

std::optional<Aggregation> Aggregator::aggregate(const std::string &key,
                                                 AggregationTrigger trigger) {
  auto samples = buffer_.drain(key);
  if (samples.empty())
    return std::nullopt;

  AggregationEvent event;
  {
    ScopedTimer timer([this](double seconds) {
      metrics_.observe_aggregation_duration(seconds);
    });
    event.aggregation = compute_aggregation(samples);
  }

  auto [metric, tags] = split_key(key);
  event.metric = metric;
  event.metric_key = key;
  event.tags = tags;
  event.trigger = trigger;
  event.persisted = persist(key, metric, tags, event.aggregation);

  baselines_.fold(key, event.aggregation);

  aggregations_.fetch_add(1);
  samples_aggregated_.fetch_add(event.aggregation.count);
  metrics_.aggregation_completed(trigger);

  LOG(LogLevel::DEBUG, LogComponent::ENGINE_AGGREGATE,
      "Aggregated " << event.aggregation.count << " samples for " << key
                    << " (trigger=" << trigger_to_string(trigger)
                    << ", avg=" << event.aggregation.avg
                    << ", p95=" << event.aggregation.p95 << ")");

  events_.publish_aggregation(event);
  return event.aggregation;
}

bool Aggregator::persist(const std::string &key, const std::string &metric,
                         const Tags &tags, const Aggregation &aggregation) {
  try {
    storage_.persist_aggregation(metric, tags, aggregation);
    return true;
  } catch (const storage::StorageError &e) {
    persist_failures_.fetch_add(1);
    metrics_.persist_failed();
    LOG(LogLevel::ERROR, LogComponent::ENGINE_AGGREGATE,
        "Failed to persist aggregation for " << key << " to "
                                             << storage_.get_name() << ": "
                                             << e.what());

    ErrorInfo error;
    error.component = "aggregator";
    error.operation = "persist_aggregation";
    error.metric_key = key;
    error.message = e.what();
    error.timestamp_ms = Utils::get_current_time_ms();
    events_.publish_error(error);
    return false;
  }
}

size_t Aggregator::aggregate_all(AggregationTrigger trigger) {
  size_t produced = 0;
  for (const auto &key : buffer_.keys_with_pending()) {
    if (aggregate(key, trigger))
      ++produced;
  }

  if (produced > 0) {
    LOG(LogLevel::INFO, LogComponent::ENGINE_AGGREGATE,
        "Aggregation pass (" << trigger_to_string(trigger) << ") produced "
                             << produced << " aggregations");
  }
  return produced;
}

AggregatorStats Aggregator::get_stats() const {
  AggregatorStats stats;
  stats.aggregations = aggregations_.load();
  stats.samples_aggregated = samples_aggregated_.load();
  stats.persist_failures = persist_failures_.load();
  return stats;
}

} // namespace analytics
