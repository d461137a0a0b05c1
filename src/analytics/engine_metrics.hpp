#ifndef ENGINE_METRICS_HPP
#define ENGINE_METRICS_HPP

#include "analytics_types.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace prometheus {
class PrometheusMetricsExporter;
}

namespace analytics {

/**
 * Engine-side facade over the Prometheus exporter. Every method is a no-op
 * until an exporter is attached; attaching registers each of the engine's
 * metric families the exporter does not already have. Updates never throw.
 */
class EngineMetrics {
public:
  void set_exporter(std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter);
  bool attached() const;

  void sample_recorded();
  void sample_rejected(const std::string &reason);
  void anomaly_detected(AnomalySeverity severity);
  void aggregation_completed(AggregationTrigger trigger);
  void persist_failed();
  void set_tracked_keys(size_t count);
  void observe_aggregation_duration(double seconds);

private:
  std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter() const;
  static void register_metrics(prometheus::PrometheusMetricsExporter &exporter);
  template <typename Update> void update(const char *name, Update &&apply);

  std::shared_ptr<prometheus::PrometheusMetricsExporter> exporter_;
};

} // namespace analytics

#endif // ENGINE_METRICS_HPP
