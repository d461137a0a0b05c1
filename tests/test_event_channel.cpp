#include "analytics/event_channel.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace analytics;

TEST(EventChannelTest, SubscribersReceiveEventsInOrder) {
  EventChannel channel;
  std::vector<std::string> seen;
  channel.on_anomaly([&seen](const AnomalyEvent &e) { seen.push_back("first:" + e.metric); });
  channel.on_anomaly([&seen](const AnomalyEvent &e) { seen.push_back("second:" + e.metric); });

  AnomalyEvent event;
  event.metric = "cpu";
  channel.publish_anomaly(event);

  EXPECT_EQ(seen, (std::vector<std::string>{"first:cpu", "second:cpu"}));
}

TEST(EventChannelTest, EventTypesAreIndependent) {
  EventChannel channel;
  int anomalies = 0, errors = 0, aggregations = 0;
  channel.on_anomaly([&](const AnomalyEvent &) { ++anomalies; });
  channel.on_error([&](const ErrorInfo &) { ++errors; });
  channel.on_aggregation([&](const AggregationEvent &) { ++aggregations; });

  channel.publish_error(ErrorInfo{});
  channel.publish_aggregation(AggregationEvent{});
  channel.publish_aggregation(AggregationEvent{});

  EXPECT_EQ(anomalies, 0);
  EXPECT_EQ(errors, 1);
  EXPECT_EQ(aggregations, 2);
  EXPECT_EQ(channel.subscriber_count(), 3u);
}

TEST(EventChannelTest, UnsubscribeStopsDelivery) {
  EventChannel channel;
  int calls = 0;
  SubscriptionId first = channel.on_error([&](const ErrorInfo &) { ++calls; });
  SubscriptionId second = channel.on_error([&](const ErrorInfo &) { ++calls; });
  EXPECT_NE(first, second);

  EXPECT_TRUE(channel.unsubscribe(first));
  EXPECT_FALSE(channel.unsubscribe(first));
  EXPECT_FALSE(channel.unsubscribe(9999));

  channel.publish_error(ErrorInfo{});
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(channel.subscriber_count(), 1u);
}

TEST(EventChannelTest, ThrowingSubscriberDoesNotStopOthers) {
  EventChannel channel;
  int delivered = 0;
  channel.on_anomaly([](const AnomalyEvent &) { throw std::runtime_error("sink down"); });
  channel.on_anomaly([&](const AnomalyEvent &) { ++delivered; });

  EXPECT_NO_THROW(channel.publish_anomaly(AnomalyEvent{}));
  EXPECT_EQ(delivered, 1);
}

TEST(EventChannelTest, CallbackMayUnsubscribeItself) {
  EventChannel channel;
  int calls = 0;
  SubscriptionId id = 0;
  id = channel.on_aggregation([&](const AggregationEvent &) {
    ++calls;
    channel.unsubscribe(id);
  });

  channel.publish_aggregation(AggregationEvent{});
  channel.publish_aggregation(AggregationEvent{});
  EXPECT_EQ(calls, 1);
}
