#ifndef EVENT_CHANNEL_HPP
#define EVENT_CHANNEL_HPP

#include "analytics_types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace analytics {

using SubscriptionId = uint64_t;

// Ordered callbacks for one event type. Publishing copies the list under the
// lock and invokes it outside, so a callback may (un)subscribe.
template <typename Event> class SubscriberList {
public:
  using Callback = std::function<void(const Event &)>;

  void add(SubscriptionId id, Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.emplace_back(id, std::move(callback));
  }

  bool remove(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
      if (it->first == id) {
        subscribers_.erase(it);
        return true;
      }
    }
    return false;
  }

  std::vector<std::pair<SubscriptionId, Callback>> copy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<SubscriptionId, Callback>> subscribers_;
};

/**
 * In-process, synchronous notification of engine events. Callbacks run on
 * the emitting thread: anomalies on the recording thread, aggregations and
 * errors on the scheduler (or the caller of flush/shutdown). A callback that
 * throws is logged and skipped; the remaining subscribers still run.
 */
class EventChannel {
public:
  using AnomalyCallback = SubscriberList<AnomalyEvent>::Callback;
  using ErrorCallback = SubscriberList<ErrorInfo>::Callback;
  using AggregationCallback = SubscriberList<AggregationEvent>::Callback;

  SubscriptionId on_anomaly(AnomalyCallback callback);
  SubscriptionId on_error(ErrorCallback callback);
  SubscriptionId on_aggregation(AggregationCallback callback);
  bool unsubscribe(SubscriptionId id);

  void publish_anomaly(const AnomalyEvent &event) const;
  void publish_error(const ErrorInfo &error) const;
  void publish_aggregation(const AggregationEvent &event) const;

  size_t subscriber_count() const;

private:
  SubscriptionId next_id() { return next_id_.fetch_add(1) + 1; }

  std::atomic<SubscriptionId> next_id_{0};
  SubscriberList<AnomalyEvent> anomaly_subscribers_;
  SubscriberList<ErrorInfo> error_subscribers_;
  SubscriberList<AggregationEvent> aggregation_subscribers_;
};

} // namespace analytics

#endif // EVENT_CHANNEL_HPP
