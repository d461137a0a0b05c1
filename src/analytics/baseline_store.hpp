#ifndef BASELINE_STORE_HPP
#define BASELINE_STORE_HPP

#include "analytics_types.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace storage {
class IStorageBackend;
}

namespace analytics {

// Cache of per-key baselines. Readers (the anomaly detector on the ingest
// path) take the lock shared; folds and loads take it exclusive.
class BaselineStore {
public:
  BaselineStore() = default;

  // Replaces the cache with the backend's baselines. StorageError propagates.
  size_t load(storage::IStorageBackend &backend);

  std::optional<BaselineStats> get(const std::string &key) const;
  void upsert(const std::string &key, const BaselineStats &stats);
  BaselineStats fold(const std::string &key, const Aggregation &aggregation);

  std::vector<std::pair<std::string, BaselineStats>> snapshot() const;
  size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, BaselineStats> baselines_;
};

} // namespace analytics

#endif // BASELINE_STORE_HPP
