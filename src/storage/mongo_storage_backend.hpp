#ifndef MONGO_STORAGE_BACKEND_HPP
#define MONGO_STORAGE_BACKEND_HPP

#include "core/config.hpp"
#include "storage_backend.hpp"

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <memory>
#include <mutex>
#include <string>

class MongoManager;

namespace storage {

/**
 * Persists one document per aggregation:
 *
 *   { metric_name, metric_key, tags: {k: v}, tag_pairs: [{k, v}], count, sum, min, max, avg, last,
 *     p50, p95, p99, sum_squares, m2, start_time_ms, end_time_ms,
 *     time_bucket: <date of end_time_ms> }
 *
 * Baselines are rebuilt by folding the documents of the lookback period in
 * end-time order. Driver exceptions surface as StorageError.
 */
class MongoStorageBackend : public IStorageBackend {
public:
  MongoStorageBackend(const Config::MongoStorageConfig &config,
                      uint32_t baseline_lookback_days);

  void open() override;
  void close() override;

  void persist_aggregation(const std::string &metric_name,
                           const analytics::Tags &tags,
                           const analytics::Aggregation &aggregation) override;
  BaselineEntries load_baseline_stats() override;
  std::vector<analytics::HistoryRow>
  query_history(const std::string &metric_name, const analytics::Tags &tags,
                const analytics::TimeRange &range,
                analytics::Granularity granularity) override;
  size_t purge_before(uint64_t cutoff_ms) override;

  const char *get_name() const override { return "mongodb"; }

  // Filter used by query_history: the name, every requested tag pair as an
  // exact match against tag_pairs, and end_time_ms inside the range.
  static bsoncxx::document::value
  history_filter(const std::string &metric_name, const analytics::Tags &tags,
                 const analytics::TimeRange &range);

private:
  std::shared_ptr<MongoManager> manager() const;
  static analytics::Aggregation
  document_to_aggregation(const bsoncxx::document::view &doc);

  Config::MongoStorageConfig config_;
  uint32_t baseline_lookback_days_;

  mutable std::mutex manager_mutex_;
  std::shared_ptr<MongoManager> manager_;
};

} // namespace storage

#endif // MONGO_STORAGE_BACKEND_HPP
