#include "metric_line_parser.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <vector>

namespace {

std::vector<std::string_view> tokenize(std::string_view line) {
  std::vector<std::string_view> tokens;
  size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t'))
      ++pos;
    size_t end = pos;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t')
      ++end;
    if (end > pos)
      tokens.push_back(line.substr(pos, end - pos));
    pos = end;
  }
  return tokens;
}

std::optional<analytics::Tags> parse_tag_token(std::string_view token) {
  analytics::Tags tags;
  for (auto pair : Utils::split_string_view(token, ',')) {
    if (pair.empty())
      continue;
    auto eq = pair.find('=');
    if (eq == std::string_view::npos || eq == 0)
      return std::nullopt;
    tags[std::string(pair.substr(0, eq))] = std::string(pair.substr(eq + 1));
  }
  return tags;
}

// Utils::string_to_number reads "-" as zero; in a metric line it is a
// missing field.
template <typename T>
std::optional<T> parse_number_field(std::string_view token) {
  if (token == "-")
    return std::nullopt;
  return Utils::string_to_number<T>(token);
}

} // namespace

std::optional<MetricLine> parse_metric_line(std::string_view line) {
  std::string trimmed = Utils::trim_copy(line);
  if (trimmed.empty() || trimmed.front() == '#')
    return std::nullopt;

  auto tokens = tokenize(trimmed);
  if (tokens.size() < 2 || tokens.size() > 4) {
    LOG(LogLevel::DEBUG, LogComponent::IO_READER,
        "Skipping metric line with " << tokens.size()
                                     << " fields: " << trimmed);
    return std::nullopt;
  }

  MetricLine parsed;
  parsed.name = std::string(tokens[0]);

  auto value = parse_number_field<double>(tokens[1]);
  if (!value || !std::isfinite(*value)) {
    LOG(LogLevel::DEBUG, LogComponent::IO_READER,
        "Skipping metric line with bad value: " << trimmed);
    return std::nullopt;
  }
  parsed.value = *value;

  for (size_t i = 2; i < tokens.size(); ++i) {
    std::string_view token = tokens[i];
    if (token.find('=') != std::string_view::npos && parsed.tags.empty() &&
        !parsed.timestamp_ms) {
      auto tags = parse_tag_token(token);
      if (!tags) {
        LOG(LogLevel::DEBUG, LogComponent::IO_READER,
            "Skipping metric line with bad tags: " << trimmed);
        return std::nullopt;
      }
      parsed.tags = std::move(*tags);
    } else if (auto ts = parse_number_field<uint64_t>(token);
               ts && !parsed.timestamp_ms && i == tokens.size() - 1) {
      parsed.timestamp_ms = *ts;
    } else {
      LOG(LogLevel::DEBUG, LogComponent::IO_READER,
          "Skipping metric line with unexpected field '"
              << std::string(token) << "': " << trimmed);
      return std::nullopt;
    }
  }
  return parsed;
}
