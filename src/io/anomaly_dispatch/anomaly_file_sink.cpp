#include "anomaly_file_sink.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

AnomalyFileSink::AnomalyFileSink(const std::string &file_path, bool to_stdout,
                                 uint64_t cooldown_seconds,
                                 std::ostream &console)
    : file_path_(file_path), to_stdout_(to_stdout),
      cooldown_ms_(cooldown_seconds * 1000), console_(console) {
  if (!file_path_.empty()) {
    Utils::create_directory_for_file(file_path_);
    file_stream_.open(file_path_, std::ios::app);
    if (!file_stream_.is_open())
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          "AnomalyFileSink could not open output file: " << file_path_);
  }
}

AnomalyFileSink::~AnomalyFileSink() {
  if (file_stream_.is_open()) {
    file_stream_.flush();
    file_stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "AnomalyFileSink closed output file: " << file_path_);
  }
}

bool AnomalyFileSink::in_cooldown(const analytics::AnomalyEvent &anomaly) {
  auto it = last_written_ms_.find(anomaly.metric_key);
  if (it == last_written_ms_.end())
    return false;
  if (anomaly.severity == analytics::AnomalySeverity::HIGH)
    return false;
  return anomaly.timestamp_ms < it->second + cooldown_ms_;
}

bool AnomalyFileSink::dispatch(const analytics::AnomalyEvent &anomaly) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (in_cooldown(anomaly)) {
    suppressed_.fetch_add(1);
    LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH,
        "Suppressed anomaly for " << anomaly.metric_key << " (cooldown)");
    return false;
  }

  std::string json_output = JsonFormatter::format_anomaly_to_json(anomaly);
  bool ok = true;

  if (file_stream_.is_open()) {
    file_stream_ << json_output << std::endl;
    if (!file_stream_.good()) {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          "Failed to write anomaly to file: " << file_path_);
      ok = false;
    }
  }
  if (to_stdout_)
    console_ << json_output << std::endl;

  if (!ok)
    return false;

  last_written_ms_[anomaly.metric_key] = anomaly.timestamp_ms;
  written_.fetch_add(1);
  LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
      "Anomaly dispatched: " << json_output);
  return true;
}

analytics::SubscriptionId
AnomalyFileSink::attach(analytics::EventChannel &events) {
  return events.on_anomaly(
      [this](const analytics::AnomalyEvent &anomaly) { dispatch(anomaly); });
}
