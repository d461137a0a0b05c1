#include "error_recovery.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <thread>

namespace error_recovery {

std::chrono::milliseconds calculate_delay(size_t attempt,
                                          const RecoveryConfig &config) {
  double delay_ms = static_cast<double>(config.base_delay.count()) *
                    std::pow(config.backoff_multiplier,
                             static_cast<double>(attempt));
  double max_ms = static_cast<double>(config.max_delay.count());
  if (!std::isfinite(delay_ms) || delay_ms > max_ms)
    delay_ms = max_ms;

  return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
}

void sleep_for_delay(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

RetryExecutor::RetryExecutor(const RecoveryConfig &config,
                             LogComponent component, SleepFunction sleep)
    : config_(config), component_(component), sleep_(std::move(sleep)) {
  if (!sleep_)
    sleep_ = sleep_for_delay;
}

RecoveryStats RetryExecutor::get_stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void RetryExecutor::record_attempt() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.total_attempts++;
}

void RetryExecutor::record_retry() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.retries++;
}

void RetryExecutor::record_outcome(size_t attempt, bool success) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  if (success && attempt > 0)
    stats_.successful_recoveries++;
  else if (!success)
    stats_.failed_recoveries++;
}

} // namespace error_recovery
