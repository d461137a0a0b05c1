#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace analytics {

double nearest_rank_percentile(const std::vector<double> &sorted_values,
                               double p) {
  if (sorted_values.empty())
    throw std::invalid_argument("Percentile of an empty set is undefined");

  const auto n = static_cast<double>(sorted_values.size());
  double rank = std::clamp(p, 0.0, 1.0) * n;

  // 0.9 * 10 must land on rank 9, not a hair above it
  double nearest = std::round(rank);
  if (std::abs(rank - nearest) < 1e-9)
    rank = nearest;

  auto index = static_cast<long long>(std::ceil(rank)) - 1;
  index = std::clamp<long long>(index, 0,
                                static_cast<long long>(sorted_values.size()) - 1);
  return sorted_values[static_cast<size_t>(index)];
}

Aggregation compute_aggregation(const std::vector<Sample> &samples) {
  if (samples.empty())
    throw std::invalid_argument("Cannot aggregate an empty batch of samples");

  Aggregation aggregation;
  aggregation.min = samples.front().value;
  aggregation.max = samples.front().value;
  aggregation.start_time_ms = samples.front().timestamp_ms;
  aggregation.end_time_ms = samples.front().timestamp_ms;

  std::vector<double> values;
  values.reserve(samples.size());

  // Single Welford pass for the moments
  double running_mean = 0.0;
  for (const auto &sample : samples) {
    const double value = sample.value;
    aggregation.count++;
    aggregation.sum += value;
    aggregation.sum_squares += value * value;

    double delta = value - running_mean;
    running_mean += delta / static_cast<double>(aggregation.count);
    aggregation.m2 += delta * (value - running_mean);

    aggregation.min = std::min(aggregation.min, value);
    aggregation.max = std::max(aggregation.max, value);
    aggregation.start_time_ms =
        std::min(aggregation.start_time_ms, sample.timestamp_ms);
    aggregation.end_time_ms =
        std::max(aggregation.end_time_ms, sample.timestamp_ms);

    values.push_back(value);
  }

  aggregation.avg = aggregation.sum / static_cast<double>(aggregation.count);
  aggregation.last = samples.back().value;
  aggregation.m2 = std::max(0.0, aggregation.m2);

  std::sort(values.begin(), values.end());
  aggregation.p50 = nearest_rank_percentile(values, 0.50);
  aggregation.p95 = nearest_rank_percentile(values, 0.95);
  aggregation.p99 = nearest_rank_percentile(values, 0.99);

  return aggregation;
}

BaselineStats fold_aggregation(const BaselineStats &baseline,
                               const Aggregation &aggregation) {
  if (aggregation.count == 0)
    return baseline;

  const auto n_a = static_cast<double>(baseline.count);
  const auto n_b = static_cast<double>(aggregation.count);
  const double n = n_a + n_b;
  const double mean_b = aggregation.sum / n_b;

  BaselineStats folded;
  folded.count = baseline.count + aggregation.count;
  folded.sum = baseline.sum + aggregation.sum;
  folded.sum_squares = baseline.sum_squares + aggregation.sum_squares;
  folded.mean = folded.sum / n;

  if (baseline.count == 0) {
    folded.m2 = aggregation.m2;
  } else {
    double delta = mean_b - baseline.mean;
    folded.m2 = baseline.m2 + aggregation.m2 + delta * delta * n_a * n_b / n;
  }

  folded.m2 = std::max(0.0, folded.m2);
  folded.std_dev = std::sqrt(std::max(0.0, folded.m2 / n));
  return folded;
}

std::vector<HistoryRow> roll_up_history(
    const std::vector<Aggregation> &aggregations, Granularity granularity) {
  const uint64_t bucket_ms = granularity_to_ms(granularity);

  std::vector<const Aggregation *> ordered;
  ordered.reserve(aggregations.size());
  for (const auto &aggregation : aggregations)
    if (aggregation.count > 0)
      ordered.push_back(&aggregation);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const Aggregation *a, const Aggregation *b) {
                     return a->end_time_ms < b->end_time_ms;
                   });

  std::map<uint64_t, HistoryRow> buckets;
  for (const Aggregation *aggregation : ordered) {
    uint64_t bucket_start =
        aggregation->end_time_ms - (aggregation->end_time_ms % bucket_ms);

    auto [it, inserted] = buckets.try_emplace(bucket_start);
    HistoryRow &row = it->second;
    if (inserted) {
      row.bucket_start_ms = bucket_start;
      row.min = aggregation->min;
      row.max = aggregation->max;
      row.p95 = aggregation->p95;
      row.p99 = aggregation->p99;
    }

    row.count += aggregation->count;
    row.sum += aggregation->sum;
    row.min = std::min(row.min, aggregation->min);
    row.max = std::max(row.max, aggregation->max);
    row.p95 = std::max(row.p95, aggregation->p95);
    row.p99 = std::max(row.p99, aggregation->p99);
    row.last = aggregation->last; // ordered by end time
  }

  std::vector<HistoryRow> rows;
  rows.reserve(buckets.size());
  for (auto &[bucket_start, row] : buckets) {
    row.avg = row.sum / static_cast<double>(row.count);
    rows.push_back(row);
  }
  return rows;
}

} // namespace analytics
