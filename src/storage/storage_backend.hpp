#ifndef STORAGE_BACKEND_HPP
#define STORAGE_BACKEND_HPP

#include "analytics/analytics_types.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace storage {

// Raised by backends for any persistence or retrieval failure.
class StorageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

using BaselineEntries =
    std::vector<std::pair<std::string, analytics::BaselineStats>>;

class IStorageBackend {
public:
  virtual ~IStorageBackend() = default;

  virtual void open() = 0;
  virtual void close() = 0;

  virtual void persist_aggregation(const std::string &metric_name,
                                   const analytics::Tags &tags,
                                   const analytics::Aggregation &aggregation) = 0;

  // One entry per canonical metric key, rebuilt from persisted aggregations.
  virtual BaselineEntries load_baseline_stats() = 0;

  // Rows for `metric_name` whose tags contain every pair in `tags`, bucketed
  // by `granularity` and ordered by bucket start.
  virtual std::vector<analytics::HistoryRow>
  query_history(const std::string &metric_name, const analytics::Tags &tags,
                const analytics::TimeRange &range,
                analytics::Granularity granularity) = 0;

  // Deletes aggregations that ended before `cutoff_ms`; returns how many.
  virtual size_t purge_before(uint64_t cutoff_ms) = 0;

  virtual const char *get_name() const = 0;
};

} // namespace storage

#endif // STORAGE_BACKEND_HPP
