#include "event_channel.hpp"
#include "core/logger.hpp"

#include <exception>

namespace analytics {

namespace {

template <typename Event>
void dispatch(const SubscriberList<Event> &subscribers, const Event &event,
              const char *event_name) {
  for (const auto &[id, callback] : subscribers.copy()) {
    try {
      callback(event);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::CORE,
          "Subscriber " << id << " threw while handling " << event_name
                        << " event: " << e.what());
    }
  }
}

} // namespace

SubscriptionId EventChannel::on_anomaly(AnomalyCallback callback) {
  SubscriptionId id = next_id();
  anomaly_subscribers_.add(id, std::move(callback));
  return id;
}

SubscriptionId EventChannel::on_error(ErrorCallback callback) {
  SubscriptionId id = next_id();
  error_subscribers_.add(id, std::move(callback));
  return id;
}

SubscriptionId EventChannel::on_aggregation(AggregationCallback callback) {
  SubscriptionId id = next_id();
  aggregation_subscribers_.add(id, std::move(callback));
  return id;
}

bool EventChannel::unsubscribe(SubscriptionId id) {
  return anomaly_subscribers_.remove(id) || error_subscribers_.remove(id) ||
         aggregation_subscribers_.remove(id);
}

void EventChannel::publish_anomaly(const AnomalyEvent &event) const {
  dispatch(anomaly_subscribers_, event, "anomaly");
}

void EventChannel::publish_error(const ErrorInfo &error) const {
  dispatch(error_subscribers_, error, "error");
}

void EventChannel::publish_aggregation(const AggregationEvent &event) const {
  dispatch(aggregation_subscribers_, event, "aggregation");
}

size_t EventChannel::subscriber_count() const {
  return anomaly_subscribers_.size() + error_subscribers_.size() +
         aggregation_subscribers_.size();
}

} // namespace analytics
