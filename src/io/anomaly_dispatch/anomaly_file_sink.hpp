#ifndef ANOMALY_FILE_SINK_HPP
#define ANOMALY_FILE_SINK_HPP

#include "analytics/analytics_types.hpp"
#include "analytics/event_channel.hpp"

#include <atomic>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * Writes anomalies as JSON lines to a file and/or an output stream.
 *
 * Within `cooldown_seconds` of the last written anomaly for a metric key,
 * further MEDIUM anomalies for that key are suppressed; HIGH ones are always
 * written.
 */
class AnomalyFileSink {
public:
  AnomalyFileSink(const std::string &file_path, bool to_stdout,
                  uint64_t cooldown_seconds,
                  std::ostream &console = std::cout);
  ~AnomalyFileSink();

  AnomalyFileSink(const AnomalyFileSink &) = delete;
  AnomalyFileSink &operator=(const AnomalyFileSink &) = delete;

  // Returns true if the anomaly was written, false if suppressed or failed.
  bool dispatch(const analytics::AnomalyEvent &anomaly);

  // Subscribes dispatch() to the channel's anomaly events.
  analytics::SubscriptionId attach(analytics::EventChannel &events);

  uint64_t written() const { return written_.load(); }
  uint64_t suppressed() const { return suppressed_.load(); }
  bool file_open() const { return file_stream_.is_open(); }

private:
  bool in_cooldown(const analytics::AnomalyEvent &anomaly);

  std::string file_path_;
  std::ofstream file_stream_;
  bool to_stdout_;
  uint64_t cooldown_ms_;
  std::ostream &console_;

  std::mutex mutex_;
  std::unordered_map<std::string, uint64_t> last_written_ms_;

  std::atomic<uint64_t> written_{0};
  std::atomic<uint64_t> suppressed_{0};
};

#endif // ANOMALY_FILE_SINK_HPP
