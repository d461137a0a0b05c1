#ifndef METRIC_KEY_HPP
#define METRIC_KEY_HPP

#include "analytics_types.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace analytics {

// Canonical key: `name:k1:v1,k2:v2` with tags in key order. A metric without
// tags yields `name:`. Backslash, ':' and ',' inside the name, tag keys and
// tag values are escaped with a backslash.
std::string canonical_key(const std::string &metric_name, const Tags &tags);

// Serializes the tag half of a canonical key.
std::string serialize_tags(const Tags &tags);

// Inverse of serialize_tags. Pairs without a separator or with an empty key
// are skipped.
Tags parse_tags(std::string_view tag_string);

// Inverse of canonical_key.
std::pair<std::string, Tags> split_key(std::string_view key);

} // namespace analytics

#endif // METRIC_KEY_HPP
