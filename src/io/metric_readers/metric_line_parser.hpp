#ifndef METRIC_LINE_PARSER_HPP
#define METRIC_LINE_PARSER_HPP

#include "analytics/analytics_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct MetricLine {
  std::string name;
  double value = 0.0;
  analytics::Tags tags;
  std::optional<uint64_t> timestamp_ms;
};

// Parses "name value [k=v,k2=v2] [timestamp_ms]", whitespace separated.
// Blank lines, '#' comments and malformed lines yield nullopt.
std::optional<MetricLine> parse_metric_line(std::string_view line);

#endif // METRIC_LINE_PARSER_HPP
