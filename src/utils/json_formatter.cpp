#include "json_formatter.hpp"

#include <cmath>

namespace {

// JSON has no infinity; a zero-variance baseline reports it as a string.
nlohmann::json finite_or_string(double value) {
  if (std::isfinite(value))
    return value;
  if (std::isnan(value))
    return "nan";
  return value > 0 ? "inf" : "-inf";
}

} // namespace

nlohmann::json
JsonFormatter::anomaly_to_json_object(const analytics::AnomalyEvent &anomaly) {
  nlohmann::json j;

  j["timestamp_ms"] = anomaly.timestamp_ms;
  j["metric"] = anomaly.metric;
  j["metric_key"] = anomaly.metric_key;
  j["tags"] = anomaly.tags;
  j["value"] = anomaly.value;
  j["severity"] = analytics::severity_to_string(anomaly.severity);
  j["deviation"] = finite_or_string(anomaly.deviation);

  j["baseline"] = {{"mean", anomaly.baseline_mean},
                   {"std_dev", anomaly.baseline_std_dev},
                   {"count", anomaly.baseline_count}};
  return j;
}

std::string
JsonFormatter::format_anomaly_to_json(const analytics::AnomalyEvent &anomaly) {
  return anomaly_to_json_object(anomaly).dump();
}

nlohmann::json JsonFormatter::aggregation_to_json_object(
    const analytics::Aggregation &aggregation) {
  return {{"count", aggregation.count},
          {"sum", aggregation.sum},
          {"min", aggregation.min},
          {"max", aggregation.max},
          {"avg", aggregation.avg},
          {"last", aggregation.last},
          {"p50", aggregation.p50},
          {"p95", aggregation.p95},
          {"p99", aggregation.p99},
          {"start_time_ms", aggregation.start_time_ms},
          {"end_time_ms", aggregation.end_time_ms}};
}

nlohmann::json
JsonFormatter::current_metrics_to_json(const analytics::CurrentMetrics &metrics) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[key, windows] : metrics) {
    nlohmann::json j_windows = nlohmann::json::object();
    for (const auto &[window_seconds, average] : windows) {
      const std::string label = std::to_string(window_seconds) + "s";
      if (average)
        j_windows[label] = *average;
      else
        j_windows[label] = nullptr;
    }
    j[key] = j_windows;
  }
  return j;
}
