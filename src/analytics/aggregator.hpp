#ifndef AGGREGATOR_HPP
#define AGGREGATOR_HPP

#include "analytics_types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace storage {
class IStorageBackend;
}

namespace analytics {

class BaselineStore;
class EngineMetrics;
class EventChannel;
class SampleBuffer;

struct AggregatorStats {
  uint64_t aggregations = 0;
  uint64_t samples_aggregated = 0;
  uint64_t persist_failures = 0;
};

/**
 * Turns a key's buffered samples into one Aggregation:
 * drain -> summarize -> persist -> fold into baseline -> publish.
 *
 * A persist failure is reported on the error channel and counted, the
 * baseline is still folded so that anomaly detection keeps learning while
 * storage is down.
 */
class Aggregator {
public:
  Aggregator(SampleBuffer &buffer, BaselineStore &baselines,
             storage::IStorageBackend &storage, const EventChannel &events,
             EngineMetrics &metrics);

  // nullopt when the key had nothing buffered.
  std::optional<Aggregation> aggregate(const std::string &key,
                                       AggregationTrigger trigger);

  // Aggregates every key with pending samples; returns how many produced
  // an aggregation.
  size_t aggregate_all(AggregationTrigger trigger);

  AggregatorStats get_stats() const;

private:
  bool persist(const std::string &key, const std::string &metric,
               const Tags &tags, const Aggregation &aggregation);

  SampleBuffer &buffer_;
  BaselineStore &baselines_;
  storage::IStorageBackend &storage_;
  const EventChannel &events_;
  EngineMetrics &metrics_;

  std::atomic<uint64_t> aggregations_{0};
  std::atomic<uint64_t> samples_aggregated_{0};
  std::atomic<uint64_t> persist_failures_{0};
};

} // namespace analytics

#endif // AGGREGATOR_HPP
