#include "engine_metrics.hpp"
#include "core/logger.hpp"
#include "core/prometheus_metrics_exporter.hpp"

#include <stdexcept>

namespace analytics {

namespace {

constexpr const char *kSamplesRecorded =
    "metrics_sentinel_samples_recorded_total";
constexpr const char *kSamplesRejected =
    "metrics_sentinel_samples_rejected_total";
constexpr const char *kAnomalies = "metrics_sentinel_anomalies_total";
constexpr const char *kAggregations = "metrics_sentinel_aggregations_total";
constexpr const char *kPersistFailures =
    "metrics_sentinel_persist_failures_total";
constexpr const char *kTrackedKeys = "metrics_sentinel_tracked_keys";
constexpr const char *kAggregationDuration =
    "metrics_sentinel_aggregation_duration_seconds";

} // namespace

void EngineMetrics::set_exporter(
    std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter) {
  if (exporter)
    register_metrics(*exporter);
  std::atomic_store(&exporter_, std::move(exporter));
}

bool EngineMetrics::attached() const { return exporter() != nullptr; }

std::shared_ptr<prometheus::PrometheusMetricsExporter>
EngineMetrics::exporter() const {
  return std::atomic_load(&exporter_);
}

void EngineMetrics::register_metrics(
    prometheus::PrometheusMetricsExporter &exporter) {
  // Families already present, from a second engine sharing the exporter or
  // from another component, are reused as they are.
  auto register_family = [&exporter](const char *name, auto &&add) {
    if (exporter.has_metric(name))
      return;
    try {
      add();
    } catch (const std::invalid_argument &e) {
      LOG(LogLevel::ERROR, LogComponent::METRICS_EXPORT,
          "Failed to register " << name << ": " << e.what());
    }
  };

  register_family(kSamplesRecorded, [&] {
    exporter.register_counter(kSamplesRecorded,
                              "Samples accepted by record_metric");
  });
  register_family(kSamplesRejected, [&] {
    exporter.register_counter(kSamplesRejected,
                              "Samples dropped by record_metric", {"reason"});
  });
  register_family(kAnomalies, [&] {
    exporter.register_counter(kAnomalies, "Anomalies detected", {"severity"});
  });
  register_family(kAggregations, [&] {
    exporter.register_counter(kAggregations, "Buffer aggregations completed",
                              {"trigger"});
  });
  register_family(kPersistFailures, [&] {
    exporter.register_counter(kPersistFailures,
                              "Aggregations that could not be persisted");
  });
  register_family(kTrackedKeys, [&] {
    exporter.register_gauge(kTrackedKeys, "Metric keys with live state");
  });
  register_family(kAggregationDuration, [&] {
    exporter.register_histogram(kAggregationDuration,
                                "Time spent aggregating one buffer",
                                {0.0001, 0.0005, 0.001, 0.005, 0.01, 0.05, 0.1,
                                 0.5, 1.0, 5.0});
  });
}

// A family registered elsewhere with another type or label set rejects the
// update; the engine's hot path must not see that.
template <typename Update>
void EngineMetrics::update(const char *name, Update &&apply) {
  auto exp = exporter();
  if (!exp)
    return;
  try {
    apply(*exp);
  } catch (const std::invalid_argument &e) {
    LOG(LogLevel::DEBUG, LogComponent::METRICS_EXPORT,
        "Dropped update of " << name << ": " << e.what());
  }
}

void EngineMetrics::sample_recorded() {
  update(kSamplesRecorded, [](prometheus::PrometheusMetricsExporter &exp) {
    exp.increment_counter(kSamplesRecorded);
  });
}

void EngineMetrics::sample_rejected(const std::string &reason) {
  update(kSamplesRejected, [&reason](prometheus::PrometheusMetricsExporter &exp) {
    exp.increment_counter(kSamplesRejected, {{"reason", reason}});
  });
}

void EngineMetrics::anomaly_detected(AnomalySeverity severity) {
  update(kAnomalies, [severity](prometheus::PrometheusMetricsExporter &exp) {
    exp.increment_counter(kAnomalies,
                          {{"severity", severity_to_string(severity)}});
  });
}

void EngineMetrics::aggregation_completed(AggregationTrigger trigger) {
  update(kAggregations, [trigger](prometheus::PrometheusMetricsExporter &exp) {
    exp.increment_counter(kAggregations,
                          {{"trigger", trigger_to_string(trigger)}});
  });
}

void EngineMetrics::persist_failed() {
  update(kPersistFailures, [](prometheus::PrometheusMetricsExporter &exp) {
    exp.increment_counter(kPersistFailures);
  });
}

void EngineMetrics::set_tracked_keys(size_t count) {
  update(kTrackedKeys, [count](prometheus::PrometheusMetricsExporter &exp) {
    exp.set_gauge(kTrackedKeys, static_cast<double>(count));
  });
}

void EngineMetrics::observe_aggregation_duration(double seconds) {
  update(kAggregationDuration,
         [seconds](prometheus::PrometheusMetricsExporter &exp) {
           exp.observe_histogram(kAggregationDuration, seconds);
         });
}

} // namespace analytics
