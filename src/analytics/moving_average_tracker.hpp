#ifndef MOVING_AVERAGE_TRACKER_HPP
#define MOVING_AVERAGE_TRACKER_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace analytics {

struct WindowSnapshot {
  double sum = 0.0;
  size_t count = 0;

  std::optional<double> average() const {
    if (count == 0)
      return std::nullopt;
    return sum / static_cast<double>(count);
  }
};

// key -> window size in seconds -> average, nullopt for an empty window
using CurrentMetrics =
    std::map<std::string, std::map<uint64_t, std::optional<double>>>;

// Time-bounded running sum over (timestamp, value) pairs kept in timestamp
// order. Entries older than the newest timestamp minus the duration are
// evicted on every add.
class MovingAverageWindow {
public:
  explicit MovingAverageWindow(uint64_t duration_ms)
      : duration_ms_(duration_ms) {}

  void add(uint64_t timestamp_ms, double value);

  WindowSnapshot snapshot() const { return {sum_, entries_.size()}; }
  uint64_t duration_ms() const { return duration_ms_; }

private:
  void evict_expired();

  uint64_t duration_ms_;
  std::deque<std::pair<uint64_t, double>> entries_;
  double sum_ = 0.0;
};

class MovingAverageTracker {
public:
  // Throws std::invalid_argument on an empty list, a zero or a duplicate size.
  explicit MovingAverageTracker(std::vector<uint64_t> window_sizes_seconds);

  void update(const std::string &key, double value, uint64_t timestamp_ms);

  std::optional<WindowSnapshot> window(const std::string &key,
                                       uint64_t window_seconds) const;
  std::optional<double> current_average(const std::string &key,
                                        uint64_t window_seconds) const;
  CurrentMetrics snapshot() const;

  const std::vector<uint64_t> &window_sizes() const { return window_sizes_; }
  size_t tracked_keys() const;

private:
  struct KeyWindows {
    mutable std::mutex mutex;
    std::vector<MovingAverageWindow> windows;
  };

  std::shared_ptr<KeyWindows> find_windows(const std::string &key) const;
  std::shared_ptr<KeyWindows> get_or_create_windows(const std::string &key);
  std::optional<size_t> window_index(uint64_t window_seconds) const;

  std::vector<uint64_t> window_sizes_;
  mutable std::shared_mutex directory_mutex_;
  std::unordered_map<std::string, std::shared_ptr<KeyWindows>> windows_;
};

} // namespace analytics

#endif // MOVING_AVERAGE_TRACKER_HPP
