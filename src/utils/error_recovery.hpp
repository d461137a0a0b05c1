#pragma once

#include "core/logger.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace error_recovery {

// Recovery configuration
struct RecoveryConfig {
  size_t max_retries = 3;
  std::chrono::milliseconds base_delay = std::chrono::milliseconds(100);
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_delay = std::chrono::milliseconds(5000);
};

// Recovery statistics
struct RecoveryStats {
  size_t total_attempts = 0;
  size_t retries = 0;
  size_t successful_recoveries = 0; // succeeded after at least one retry
  size_t failed_recoveries = 0;     // gave up after the last retry
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// base_delay * backoff_multiplier^attempt, capped at max_delay
std::chrono::milliseconds calculate_delay(size_t attempt,
                                          const RecoveryConfig &config);

void sleep_for_delay(std::chrono::milliseconds delay);

/**
 * Runs an operation with bounded exponential backoff. Only exceptions of
 * type `Exception` are retried; anything else propagates immediately. When
 * the retries are exhausted the last exception is rethrown to the caller.
 */
class RetryExecutor {
public:
  explicit RetryExecutor(const RecoveryConfig &config,
                         LogComponent component = LogComponent::CORE,
                         SleepFunction sleep = sleep_for_delay);

  template <typename Exception, typename Func>
  auto execute(const std::string &operation, Func &&func)
      -> decltype(func());

  RecoveryStats get_stats() const;
  const RecoveryConfig &get_config() const { return config_; }

private:
  void record_attempt();
  void record_retry();
  void record_outcome(size_t attempt, bool success);

  RecoveryConfig config_;
  LogComponent component_;
  SleepFunction sleep_;

  mutable std::mutex stats_mutex_;
  RecoveryStats stats_;
};

// Template implementation
template <typename Exception, typename Func>
auto RetryExecutor::execute(const std::string &operation, Func &&func)
    -> decltype(func()) {
  for (size_t attempt = 0;; ++attempt) {
    record_attempt();
    try {
      if constexpr (std::is_void_v<decltype(func())>) {
        func();
        record_outcome(attempt, true);
        return;
      } else {
        auto result = func();
        record_outcome(attempt, true);
        return result;
      }
    } catch (const Exception &e) {
      if (attempt >= config_.max_retries) {
        record_outcome(attempt, false);
        LOG(LogLevel::ERROR, component_,
            operation << " failed after " << (attempt + 1)
                      << " attempt(s): " << e.what());
        throw;
      }

      auto delay = calculate_delay(attempt, config_);
      LOG(LogLevel::WARN, component_,
          operation << " failed (attempt " << (attempt + 1) << "/"
                    << (config_.max_retries + 1) << "): " << e.what()
                    << ". Retrying in " << delay.count() << " ms");
      record_retry();
      sleep_(delay);
    }
  }
}

} // namespace error_recovery
