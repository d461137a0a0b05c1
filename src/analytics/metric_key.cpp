#include "metric_key.hpp"

#include <string>
#include <string_view>

namespace analytics {

namespace {

constexpr char ESCAPE_CHAR = '\\';
constexpr char NAME_SEPARATOR = ':';
constexpr char PAIR_SEPARATOR = ',';
constexpr char VALUE_SEPARATOR = ':';

void append_escaped(std::string &out, std::string_view text) {
  for (char c : text) {
    if (c == ESCAPE_CHAR || c == NAME_SEPARATOR || c == PAIR_SEPARATOR)
      out.push_back(ESCAPE_CHAR);
    out.push_back(c);
  }
}

std::string unescape(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == ESCAPE_CHAR && i + 1 < text.size()) {
      out.push_back(text[++i]);
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

size_t find_unescaped(std::string_view text, char target, size_t from = 0) {
  for (size_t i = from; i < text.size(); ++i) {
    if (text[i] == ESCAPE_CHAR) {
      ++i;
      continue;
    }
    if (text[i] == target)
      return i;
  }
  return std::string_view::npos;
}

} // namespace

std::string serialize_tags(const Tags &tags) {
  std::string out;
  bool first = true;
  for (const auto &[tag_key, tag_value] : tags) {
    if (!first)
      out.push_back(PAIR_SEPARATOR);
    append_escaped(out, tag_key);
    out.push_back(VALUE_SEPARATOR);
    append_escaped(out, tag_value);
    first = false;
  }
  return out;
}

std::string canonical_key(const std::string &metric_name, const Tags &tags) {
  std::string key;
  key.reserve(metric_name.size() + 1 + tags.size() * 16);
  append_escaped(key, metric_name);
  key.push_back(NAME_SEPARATOR);
  key += serialize_tags(tags);
  return key;
}

Tags parse_tags(std::string_view tag_string) {
  Tags tags;
  size_t start = 0;
  while (start <= tag_string.size()) {
    size_t end = find_unescaped(tag_string, PAIR_SEPARATOR, start);
    std::string_view pair = tag_string.substr(
        start, end == std::string_view::npos ? std::string_view::npos
                                             : end - start);

    size_t separator = find_unescaped(pair, VALUE_SEPARATOR);
    if (separator != std::string_view::npos && separator > 0)
      tags[unescape(pair.substr(0, separator))] =
          unescape(pair.substr(separator + 1));

    if (end == std::string_view::npos)
      break;
    start = end + 1;
  }
  return tags;
}

std::pair<std::string, Tags> split_key(std::string_view key) {
  size_t separator = find_unescaped(key, NAME_SEPARATOR);
  if (separator == std::string_view::npos)
    return {unescape(key), Tags{}};

  return {unescape(key.substr(0, separator)),
          parse_tags(key.substr(separator + 1))};
}

} // namespace analytics
