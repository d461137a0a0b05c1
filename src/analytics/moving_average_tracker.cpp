#include "moving_average_tracker.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

namespace analytics {

void MovingAverageWindow::add(uint64_t timestamp_ms, double value) {
  // Out-of-order samples are placed after any equal timestamps
  auto position = std::upper_bound(
      entries_.begin(), entries_.end(), timestamp_ms,
      [](uint64_t time, const std::pair<uint64_t, double> &element) {
        return time < element.first;
      });
  entries_.emplace(position, timestamp_ms, value);
  sum_ += value;

  evict_expired();
}

void MovingAverageWindow::evict_expired() {
  if (entries_.empty())
    return;

  const uint64_t newest = entries_.back().first;
  // Avoid underflow if the newest timestamp is less than the duration
  const uint64_t cutoff = newest >= duration_ms_ ? newest - duration_ms_ : 0;

  while (!entries_.empty() && entries_.front().first < cutoff) {
    sum_ -= entries_.front().second;
    entries_.pop_front();
  }

  if (entries_.empty())
    sum_ = 0.0;
}

MovingAverageTracker::MovingAverageTracker(
    std::vector<uint64_t> window_sizes_seconds)
    : window_sizes_(std::move(window_sizes_seconds)) {
  if (window_sizes_.empty())
    throw std::invalid_argument("At least one moving average window is required");

  std::set<uint64_t> unique_sizes;
  for (uint64_t size : window_sizes_) {
    if (size == 0)
      throw std::invalid_argument("Moving average window size must be > 0");
    if (!unique_sizes.insert(size).second)
      throw std::invalid_argument("Duplicate moving average window size: " +
                                  std::to_string(size));
  }
}

std::shared_ptr<MovingAverageTracker::KeyWindows>
MovingAverageTracker::find_windows(const std::string &key) const {
  std::shared_lock<std::shared_mutex> lock(directory_mutex_);
  auto it = windows_.find(key);
  if (it == windows_.end())
    return nullptr;
  return it->second;
}

std::shared_ptr<MovingAverageTracker::KeyWindows>
MovingAverageTracker::get_or_create_windows(const std::string &key) {
  if (auto existing = find_windows(key))
    return existing;

  std::unique_lock<std::shared_mutex> lock(directory_mutex_);
  auto [it, inserted] = windows_.try_emplace(key, nullptr);
  if (inserted) {
    auto created = std::make_shared<KeyWindows>();
    created->windows.reserve(window_sizes_.size());
    for (uint64_t size : window_sizes_)
      created->windows.emplace_back(size * 1000);
    it->second = std::move(created);
  }
  return it->second;
}

std::optional<size_t>
MovingAverageTracker::window_index(uint64_t window_seconds) const {
  auto it = std::find(window_sizes_.begin(), window_sizes_.end(),
                      window_seconds);
  if (it == window_sizes_.end())
    return std::nullopt;
  return static_cast<size_t>(std::distance(window_sizes_.begin(), it));
}

void MovingAverageTracker::update(const std::string &key, double value,
                                  uint64_t timestamp_ms) {
  auto key_windows = get_or_create_windows(key);

  std::lock_guard<std::mutex> lock(key_windows->mutex);
  for (auto &window : key_windows->windows)
    window.add(timestamp_ms, value);

  LOG(LogLevel::TRACE, LogComponent::ENGINE_WINDOW,
      "Updated " << key_windows->windows.size() << " windows for " << key);
}

std::optional<WindowSnapshot>
MovingAverageTracker::window(const std::string &key,
                             uint64_t window_seconds) const {
  auto index = window_index(window_seconds);
  if (!index)
    return std::nullopt;

  auto key_windows = find_windows(key);
  if (!key_windows)
    return std::nullopt;

  std::lock_guard<std::mutex> lock(key_windows->mutex);
  return key_windows->windows[*index].snapshot();
}

std::optional<double>
MovingAverageTracker::current_average(const std::string &key,
                                      uint64_t window_seconds) const {
  auto snapshot = window(key, window_seconds);
  if (!snapshot)
    return std::nullopt;
  return snapshot->average();
}

CurrentMetrics MovingAverageTracker::snapshot() const {
  std::vector<std::pair<std::string, std::shared_ptr<KeyWindows>>> entries;
  {
    std::shared_lock<std::shared_mutex> lock(directory_mutex_);
    entries.assign(windows_.begin(), windows_.end());
  }

  CurrentMetrics metrics;
  for (const auto &[key, key_windows] : entries) {
    auto &per_window = metrics[key];
    std::lock_guard<std::mutex> lock(key_windows->mutex);
    for (size_t i = 0; i < window_sizes_.size(); ++i)
      per_window[window_sizes_[i]] = key_windows->windows[i].snapshot().average();
  }
  return metrics;
}

size_t MovingAverageTracker::tracked_keys() const {
  std::shared_lock<std::shared_mutex> lock(directory_mutex_);
  return windows_.size();
}

} // namespace analytics
