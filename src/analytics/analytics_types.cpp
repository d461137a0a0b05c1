#include "analytics_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace analytics {

const char *severity_to_string(AnomalySeverity severity) {
  switch (severity) {
  case AnomalySeverity::MEDIUM:
    return "medium";
  case AnomalySeverity::HIGH:
    return "high";
  }
  return "unknown";
}

const char *trigger_to_string(AggregationTrigger trigger) {
  switch (trigger) {
  case AggregationTrigger::PERIODIC:
    return "periodic";
  case AggregationTrigger::BUFFER_OVERFLOW:
    return "overflow";
  case AggregationTrigger::MANUAL:
    return "manual";
  case AggregationTrigger::SHUTDOWN:
    return "shutdown";
  }
  return "unknown";
}

const char *granularity_to_string(Granularity granularity) {
  switch (granularity) {
  case Granularity::MINUTE:
    return "minute";
  case Granularity::HOUR:
    return "hour";
  case Granularity::DAY:
    return "day";
  }
  return "unknown";
}

std::optional<Granularity> granularity_from_string(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);
  if (lowered == "minute" || lowered == "minutely")
    return Granularity::MINUTE;
  if (lowered == "hour" || lowered == "hourly")
    return Granularity::HOUR;
  if (lowered == "day" || lowered == "daily")
    return Granularity::DAY;
  return std::nullopt;
}

uint64_t granularity_to_ms(Granularity granularity) {
  switch (granularity) {
  case Granularity::MINUTE:
    return 60ULL * 1000;
  case Granularity::HOUR:
    return 3600ULL * 1000;
  case Granularity::DAY:
    return 86400ULL * 1000;
  }
  return 60ULL * 1000;
}

BaselineStats make_baseline(uint64_t count, double mean, double std_dev) {
  BaselineStats stats;
  stats.count = count;
  stats.mean = mean;
  stats.std_dev = std_dev;
  stats.sum = mean * static_cast<double>(count);
  stats.m2 = std_dev * std_dev * static_cast<double>(count);
  stats.sum_squares = stats.m2 + static_cast<double>(count) * mean * mean;
  return stats;
}

} // namespace analytics
