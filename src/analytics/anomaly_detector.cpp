#include "anomaly_detector.hpp"
#include "baseline_store.hpp"
#include "core/logger.hpp"
#include "metric_key.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace analytics {

AnomalyDetector::AnomalyDetector(const BaselineStore &baselines,
                                 double threshold, uint64_t min_samples)
    : baselines_(baselines), threshold_(threshold), min_samples_(min_samples) {
  if (!std::isfinite(threshold_) || threshold_ <= 0.0)
    throw std::invalid_argument("Anomaly threshold must be a positive number");
}

std::optional<AnomalySeverity>
AnomalyDetector::classify(double deviation) const {
  if (std::isnan(deviation) || deviation < threshold_)
    return std::nullopt;
  if (deviation >= 2.0 * threshold_)
    return AnomalySeverity::HIGH;
  return AnomalySeverity::MEDIUM;
}

std::optional<AnomalyEvent> AnomalyDetector::detect(const std::string &key,
                                                    double value) const {
  auto [metric, tags] = split_key(key);
  return detect(key, metric, tags, value, Utils::get_current_time_ms());
}

std::optional<AnomalyEvent>
AnomalyDetector::detect(const std::string &key, const std::string &metric,
                        const Tags &tags, double value,
                        uint64_t timestamp_ms) const {
  if (!std::isfinite(value))
    return std::nullopt;

  auto baseline = baselines_.get(key);
  if (!baseline || baseline->count < min_samples_)
    return std::nullopt;

  const double delta = std::abs(value - baseline->mean);
  double deviation = 0.0;
  if (baseline->std_dev > 0.0) {
    deviation = delta / baseline->std_dev;
  } else {
    if (delta == 0.0)
      return std::nullopt;
    deviation = std::numeric_limits<double>::infinity();
  }

  auto severity = classify(deviation);
  if (!severity)
    return std::nullopt;

  AnomalyEvent event;
  event.metric = metric;
  event.metric_key = key;
  event.value = value;
  event.tags = tags;
  event.deviation = deviation;
  event.severity = *severity;
  event.baseline_mean = baseline->mean;
  event.baseline_std_dev = baseline->std_dev;
  event.baseline_count = baseline->count;
  event.timestamp_ms = timestamp_ms;

  LOG(LogLevel::DEBUG, LogComponent::ENGINE_ANOMALY,
      "Anomaly on " << key << ": value=" << value << " deviation=" << deviation
                    << " severity=" << severity_to_string(*severity));
  return event;
}

} // namespace analytics
