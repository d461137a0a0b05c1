#ifndef ANOMALY_DETECTOR_HPP
#define ANOMALY_DETECTOR_HPP

#include "analytics_types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace analytics {

class BaselineStore;

/**
 * Scores a value against its key's baseline:
 * deviation = |value - mean| / std_dev.
 *
 *   deviation <  threshold                    -> no anomaly
 *   threshold <= deviation < 2 * threshold    -> MEDIUM
 *   deviation >= 2 * threshold                -> HIGH
 *
 * Baselines with fewer than `min_samples` observations are not judged. A
 * zero-variance baseline flags any change from the mean as HIGH with an
 * infinite deviation. Non-finite values are skipped.
 */
class AnomalyDetector {
public:
  AnomalyDetector(const BaselineStore &baselines, double threshold,
                  uint64_t min_samples);

  std::optional<AnomalyEvent> detect(const std::string &key,
                                     double value) const;

  std::optional<AnomalyEvent> detect(const std::string &key,
                                     const std::string &metric,
                                     const Tags &tags, double value,
                                     uint64_t timestamp_ms) const;

  std::optional<AnomalySeverity> classify(double deviation) const;

  double threshold() const { return threshold_; }
  uint64_t min_samples() const { return min_samples_; }

private:
  const BaselineStore &baselines_;
  double threshold_;
  uint64_t min_samples_;
};

} // namespace analytics

#endif // ANOMALY_DETECTOR_HPP
