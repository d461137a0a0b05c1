#ifndef QUERY_FACADE_HPP
#define QUERY_FACADE_HPP

#include "analytics_types.hpp"

#include <string>
#include <vector>

namespace storage {
class IStorageBackend;
}

namespace analytics {

// Read path for historical aggregations. Arguments are validated here,
// storage errors propagate to the caller unretried.
class QueryFacade {
public:
  explicit QueryFacade(storage::IStorageBackend &storage);

  // Throws std::invalid_argument for an empty name or start > end.
  std::vector<HistoryRow> get_metric_history(const std::string &metric_name,
                                             const Tags &tags,
                                             const TimeRange &range,
                                             Granularity granularity) const;

private:
  storage::IStorageBackend &storage_;
};

} // namespace analytics

#endif // QUERY_FACADE_HPP
