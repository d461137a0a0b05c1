#include "retrying_storage_backend.hpp"

#include <stdexcept>

namespace storage {

namespace {

std::shared_ptr<IStorageBackend>
require_inner(std::shared_ptr<IStorageBackend> inner) {
  if (!inner)
    throw std::invalid_argument("RetryingStorageBackend needs a backend");
  return inner;
}

} // namespace

RetryingStorageBackend::RetryingStorageBackend(
    std::shared_ptr<IStorageBackend> inner,
    const error_recovery::RecoveryConfig &config,
    error_recovery::SleepFunction sleep)
    : inner_(require_inner(std::move(inner))),
      executor_(config, LogComponent::STORAGE, std::move(sleep)),
      name_(std::string("retrying(") + inner_->get_name() + ")") {}

void RetryingStorageBackend::open() {
  executor_.execute<StorageError>(std::string("open ") + inner_->get_name(),
                                  [this] { inner_->open(); });
}

void RetryingStorageBackend::close() { inner_->close(); }

void RetryingStorageBackend::persist_aggregation(
    const std::string &metric_name, const analytics::Tags &tags,
    const analytics::Aggregation &aggregation) {
  executor_.execute<StorageError>(
      "persist_aggregation(" + metric_name + ")",
      [&] { inner_->persist_aggregation(metric_name, tags, aggregation); });
}

BaselineEntries RetryingStorageBackend::load_baseline_stats() {
  return executor_.execute<StorageError>(
      "load_baseline_stats", [this] { return inner_->load_baseline_stats(); });
}

std::vector<analytics::HistoryRow> RetryingStorageBackend::query_history(
    const std::string &metric_name, const analytics::Tags &tags,
    const analytics::TimeRange &range, analytics::Granularity granularity) {
  return inner_->query_history(metric_name, tags, range, granularity);
}

size_t RetryingStorageBackend::purge_before(uint64_t cutoff_ms) {
  return executor_.execute<StorageError>(
      "purge_before", [&] { return inner_->purge_before(cutoff_ms); });
}

} // namespace storage
