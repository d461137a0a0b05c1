#include "baseline_store.hpp"
#include "core/logger.hpp"
#include "statistics.hpp"
#include "storage/storage_backend.hpp"

#include <mutex>

namespace analytics {

size_t BaselineStore::load(storage::IStorageBackend &backend) {
  auto entries = backend.load_baseline_stats();

  std::unordered_map<std::string, BaselineStats> loaded;
  loaded.reserve(entries.size());
  for (auto &entry : entries)
    loaded[entry.first] = entry.second;

  size_t loaded_count = loaded.size();
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    baselines_.swap(loaded);
  }

  LOG(LogLevel::INFO, LogComponent::ENGINE_BASELINE,
      "Loaded " << loaded_count << " baselines from " << backend.get_name());
  return loaded_count;
}

std::optional<BaselineStats> BaselineStore::get(const std::string &key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = baselines_.find(key);
  if (it == baselines_.end())
    return std::nullopt;
  return it->second;
}

void BaselineStore::upsert(const std::string &key, const BaselineStats &stats) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  baselines_[key] = stats;
}

BaselineStats BaselineStore::fold(const std::string &key,
                                  const Aggregation &aggregation) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  BaselineStats &current = baselines_[key];
  current = fold_aggregation(current, aggregation);

  LOG(LogLevel::DEBUG, LogComponent::ENGINE_BASELINE,
      "Baseline for " << key << " now count=" << current.count
                      << " mean=" << current.mean
                      << " std_dev=" << current.std_dev);
  return current;
}

std::vector<std::pair<std::string, BaselineStats>>
BaselineStore::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return {baselines_.begin(), baselines_.end()};
}

size_t BaselineStore::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return baselines_.size();
}

} // namespace analytics
