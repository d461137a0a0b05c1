#ifndef ANALYTICS_TYPES_HPP
#define ANALYTICS_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace analytics {

using Tags = std::map<std::string, std::string>;

struct Sample {
  double value = 0.0;
  uint64_t timestamp_ms = 0;
};

// Summary of one drained buffer. `sum_squares` and `m2` carry the second
// moment so the baseline can be folded without revisiting raw samples.
struct Aggregation {
  uint64_t count = 0;
  double sum = 0.0;
  double min = 0.0;
  double max = 0.0;
  double avg = 0.0;
  double last = 0.0;
  double p50 = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
  double sum_squares = 0.0;
  double m2 = 0.0; // sum of squared deviations from avg
  uint64_t start_time_ms = 0;
  uint64_t end_time_ms = 0;
};

struct BaselineStats {
  uint64_t count = 0;
  double mean = 0.0;
  double std_dev = 0.0;
  double sum = 0.0;
  double sum_squares = 0.0;
  double m2 = 0.0;
};

enum class AnomalySeverity { MEDIUM, HIGH };

struct AnomalyEvent {
  std::string metric;
  std::string metric_key;
  double value = 0.0;
  Tags tags;
  double deviation = 0.0;
  AnomalySeverity severity = AnomalySeverity::MEDIUM;
  double baseline_mean = 0.0;
  double baseline_std_dev = 0.0;
  uint64_t baseline_count = 0;
  uint64_t timestamp_ms = 0;
};

enum class AggregationTrigger { PERIODIC, BUFFER_OVERFLOW, MANUAL, SHUTDOWN };

struct AggregationEvent {
  std::string metric;
  std::string metric_key;
  Tags tags;
  Aggregation aggregation;
  AggregationTrigger trigger = AggregationTrigger::PERIODIC;
  bool persisted = false;
};

struct ErrorInfo {
  std::string component;
  std::string operation;
  std::string metric_key; // empty when the failure is not tied to one key
  std::string message;
  uint64_t timestamp_ms = 0;
};

enum class Granularity { MINUTE, HOUR, DAY };

struct TimeRange {
  uint64_t start_ms = 0;
  uint64_t end_ms = 0;
};

// One bucket of history as returned by a storage backend.
struct HistoryRow {
  uint64_t bucket_start_ms = 0;
  uint64_t count = 0;
  double sum = 0.0;
  double avg = 0.0;
  double min = 0.0;
  double max = 0.0;
  double last = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
};

const char *severity_to_string(AnomalySeverity severity);
const char *trigger_to_string(AggregationTrigger trigger);
const char *granularity_to_string(Granularity granularity);
std::optional<Granularity> granularity_from_string(std::string_view text);
uint64_t granularity_to_ms(Granularity granularity);

// Builds a baseline from its externally visible summary (population std dev).
BaselineStats make_baseline(uint64_t count, double mean, double std_dev);

} // namespace analytics

#endif // ANALYTICS_TYPES_HPP
