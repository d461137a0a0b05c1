#ifndef ANALYTICS_STATISTICS_HPP
#define ANALYTICS_STATISTICS_HPP

#include "analytics_types.hpp"

#include <vector>

namespace analytics {

/**
 * Summarizes a batch of samples in arrival order. `last` is the value of the
 * last sample in the batch, start/end are the min/max timestamps.
 * Percentiles use nearest rank over the sorted values.
 * Throws std::invalid_argument on an empty batch.
 */
Aggregation compute_aggregation(const std::vector<Sample> &samples);

// Nearest-rank percentile over ascending `sorted_values`, p in [0, 1]:
// index = ceil(p * n) - 1, clamped to [0, n - 1].
double nearest_rank_percentile(const std::vector<double> &sorted_values,
                               double p);

// Chan's parallel merge of an aggregation into a running baseline.
BaselineStats fold_aggregation(const BaselineStats &baseline,
                               const Aggregation &aggregation);

// Groups aggregations by `end_time_ms` into buckets of `granularity`,
// ascending by bucket start.
std::vector<HistoryRow> roll_up_history(
    const std::vector<Aggregation> &aggregations, Granularity granularity);

} // namespace analytics

#endif // ANALYTICS_STATISTICS_HPP
