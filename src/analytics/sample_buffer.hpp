#ifndef SAMPLE_BUFFER_HPP
#define SAMPLE_BUFFER_HPP

#include "analytics_types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace analytics {

struct AppendResult {
  size_t length = 0;      // buffer length after the append
  bool overflowed = false; // set once per drain cycle, on reaching the threshold
};

/**
 * Per-key append-only sample queues. The key directory is guarded by a
 * shared mutex that appends only take shared; each key has its own mutex, so
 * writers to different keys never serialize on each other.
 */
class SampleBuffer {
public:
  explicit SampleBuffer(size_t overflow_threshold);

  AppendResult append(const std::string &key, const Sample &sample);

  // Swaps the key's buffer for an empty one and returns what was there.
  std::vector<Sample> drain(const std::string &key);

  std::vector<std::string> keys() const;
  std::vector<std::string> keys_with_pending() const;
  size_t pending_count(const std::string &key) const;
  size_t total_pending() const;
  size_t overflow_threshold() const { return overflow_threshold_; }

private:
  struct KeyBuffer {
    mutable std::mutex mutex;
    std::vector<Sample> samples;
    bool overflow_signalled = false;
  };

  std::shared_ptr<KeyBuffer> find_buffer(const std::string &key) const;
  std::shared_ptr<KeyBuffer> get_or_create_buffer(const std::string &key);

  size_t overflow_threshold_;
  mutable std::shared_mutex directory_mutex_;
  std::unordered_map<std::string, std::shared_ptr<KeyBuffer>> buffers_;
};

} // namespace analytics

#endif // SAMPLE_BUFFER_HPP
