#include "in_memory_storage_backend.hpp"
#include "analytics/metric_key.hpp"
#include "analytics/statistics.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <iterator>
#include <map>

namespace storage {

namespace {

constexpr uint64_t kMillisPerDay = 24ULL * 60 * 60 * 1000;

bool tags_match(const analytics::Tags &row_tags,
                const analytics::Tags &filter) {
  for (const auto &[key, value] : filter) {
    auto it = row_tags.find(key);
    if (it == row_tags.end() || it->second != value)
      return false;
  }
  return true;
}

} // namespace

InMemoryStorageBackend::InMemoryStorageBackend(uint32_t baseline_lookback_days)
    : baseline_lookback_days_(baseline_lookback_days) {}

void InMemoryStorageBackend::maybe_fail(size_t &remaining,
                                        const char *operation) {
  if (remaining == 0)
    return;
  --remaining;
  throw StorageError(std::string("Injected failure in ") + operation);
}

void InMemoryStorageBackend::require_open(const char *operation) const {
  if (!open_)
    throw StorageError(std::string(operation) +
                       " called on a closed in-memory backend");
}

void InMemoryStorageBackend::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++open_calls_;
  maybe_fail(fail_opens_, "open");
  open_ = true;
  LOG(LogLevel::DEBUG, LogComponent::STORAGE,
      "In-memory backend opened with " << rows_.size() << " rows");
}

void InMemoryStorageBackend::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++close_calls_;
  open_ = false;
}

void InMemoryStorageBackend::persist_aggregation(
    const std::string &metric_name, const analytics::Tags &tags,
    const analytics::Aggregation &aggregation) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++persist_calls_;
  require_open("persist_aggregation");
  maybe_fail(fail_persists_, "persist_aggregation");

  rows_.push_back({metric_name, tags,
                   analytics::canonical_key(metric_name, tags), aggregation});
}

BaselineEntries InMemoryStorageBackend::load_baseline_stats() {
  std::vector<const StoredAggregation *> recent;
  BaselineEntries entries;

  std::lock_guard<std::mutex> lock(mutex_);
  ++load_calls_;
  require_open("load_baseline_stats");
  maybe_fail(fail_loads_, "load_baseline_stats");

  uint64_t cutoff = 0;
  const uint64_t now = Utils::get_current_time_ms();
  const uint64_t lookback = baseline_lookback_days_ * kMillisPerDay;
  if (baseline_lookback_days_ > 0 && now > lookback)
    cutoff = now - lookback;

  for (const auto &row : rows_)
    if (row.aggregation.end_time_ms >= cutoff)
      recent.push_back(&row);
  std::stable_sort(recent.begin(), recent.end(),
                   [](const StoredAggregation *a, const StoredAggregation *b) {
                     return a->aggregation.end_time_ms <
                            b->aggregation.end_time_ms;
                   });

  std::map<std::string, analytics::BaselineStats> folded;
  for (const auto *row : recent)
    folded[row->metric_key] =
        analytics::fold_aggregation(folded[row->metric_key], row->aggregation);

  entries.assign(folded.begin(), folded.end());
  return entries;
}

std::vector<analytics::HistoryRow> InMemoryStorageBackend::query_history(
    const std::string &metric_name, const analytics::Tags &tags,
    const analytics::TimeRange &range, analytics::Granularity granularity) {
  std::vector<analytics::Aggregation> matching;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open("query_history");
    for (const auto &row : rows_) {
      if (row.metric_name != metric_name || !tags_match(row.tags, tags))
        continue;
      const auto &aggregation = row.aggregation;
      if (aggregation.end_time_ms < range.start_ms ||
          aggregation.end_time_ms > range.end_ms)
        continue;
      matching.push_back(aggregation);
    }
  }
  return analytics::roll_up_history(matching, granularity);
}

size_t InMemoryStorageBackend::purge_before(uint64_t cutoff_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  require_open("purge_before");
  maybe_fail(fail_purges_, "purge_before");

  auto first_removed =
      std::remove_if(rows_.begin(), rows_.end(),
                     [cutoff_ms](const StoredAggregation &row) {
                       return row.aggregation.end_time_ms < cutoff_ms;
                     });
  size_t removed = static_cast<size_t>(std::distance(first_removed, rows_.end()));
  rows_.erase(first_removed, rows_.end());
  return removed;
}

void InMemoryStorageBackend::fail_next_opens(size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_opens_ = count;
}

void InMemoryStorageBackend::fail_next_persists(size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_persists_ = count;
}

void InMemoryStorageBackend::fail_next_loads(size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_loads_ = count;
}

void InMemoryStorageBackend::fail_next_purges(size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_purges_ = count;
}

bool InMemoryStorageBackend::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

std::vector<StoredAggregation> InMemoryStorageBackend::rows() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rows_;
}

size_t InMemoryStorageBackend::row_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rows_.size();
}

size_t InMemoryStorageBackend::persist_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return persist_calls_;
}

size_t InMemoryStorageBackend::load_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return load_calls_;
}

size_t InMemoryStorageBackend::open_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_calls_;
}

size_t InMemoryStorageBackend::close_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return close_calls_;
}

} // namespace storage
