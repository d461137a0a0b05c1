#include "query_facade.hpp"
#include "core/logger.hpp"
#include "storage/storage_backend.hpp"

#include <stdexcept>

namespace analytics {

QueryFacade::QueryFacade(storage::IStorageBackend &storage)
    : storage_(storage) {}

std::vector<HistoryRow>
QueryFacade::get_metric_history(const std::string &metric_name,
                                const Tags &tags, const TimeRange &range,
                                Granularity granularity) const {
  if (metric_name.empty())
    throw std::invalid_argument("Metric name must not be empty");
  if (range.start_ms > range.end_ms)
    throw std::invalid_argument("Time range start must not be after its end");

  auto rows = storage_.query_history(metric_name, tags, range, granularity);
  LOG(LogLevel::DEBUG, LogComponent::STORAGE,
      "History query for " << metric_name << " ["
                           << range.start_ms << ", " << range.end_ms << "] at "
                           << granularity_to_string(granularity) << " returned "
                           << rows.size() << " rows");
  return rows;
}

} // namespace analytics
