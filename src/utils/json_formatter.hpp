#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analytics/analytics_types.hpp"
#include "analytics/moving_average_tracker.hpp"
#include <nlohmann/json.hpp>

#include <string>

namespace JsonFormatter {

nlohmann::json anomaly_to_json_object(const analytics::AnomalyEvent &anomaly);
std::string format_anomaly_to_json(const analytics::AnomalyEvent &anomaly);

nlohmann::json
aggregation_to_json_object(const analytics::Aggregation &aggregation);

// {"<metric key>": {"60s": 12.5, "300s": null, ...}, ...}
nlohmann::json
current_metrics_to_json(const analytics::CurrentMetrics &metrics);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
