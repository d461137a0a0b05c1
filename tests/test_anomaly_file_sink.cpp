#include "analytics/event_channel.hpp"
#include "io/anomaly_dispatch/anomaly_file_sink.hpp"
#include "utils/json_formatter.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

class AnomalyFileSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "metrics_sentinel_sink_test";
        std::filesystem::remove_all(test_dir);
        output_path = (test_dir / "out" / "anomalies.json").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::vector<nlohmann::json> readLines() {
        std::vector<nlohmann::json> lines;
        std::ifstream in(output_path);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty())
                lines.push_back(nlohmann::json::parse(line));
        }
        return lines;
    }

    static analytics::AnomalyEvent makeAnomaly(const std::string &key,
                                               analytics::AnomalySeverity severity,
                                               uint64_t timestamp_ms) {
        analytics::AnomalyEvent event;
        event.metric = "latency";
        event.metric_key = key;
        event.tags = {{"host", "a"}};
        event.value = 140.0;
        event.deviation = 4.0;
        event.severity = severity;
        event.baseline_mean = 100.0;
        event.baseline_std_dev = 10.0;
        event.baseline_count = 200;
        event.timestamp_ms = timestamp_ms;
        return event;
    }

    std::filesystem::path test_dir;
    std::string output_path;
    std::ostringstream console;
};

TEST_F(AnomalyFileSinkTest, WritesJsonLinesToFileAndConsole) {
    AnomalyFileSink sink(output_path, true, 0, console);
    ASSERT_TRUE(sink.file_open());

    EXPECT_TRUE(sink.dispatch(makeAnomaly("latency:host:a", analytics::AnomalySeverity::MEDIUM, 5000)));
    EXPECT_EQ(sink.written(), 1u);
    EXPECT_NE(console.str().find("\"severity\":\"medium\""), std::string::npos);

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["metric"], "latency");
    EXPECT_EQ(lines[0]["metric_key"], "latency:host:a");
    EXPECT_EQ(lines[0]["tags"]["host"], "a");
    EXPECT_EQ(lines[0]["timestamp_ms"], 5000);
    EXPECT_DOUBLE_EQ(lines[0]["deviation"].get<double>(), 4.0);
    EXPECT_DOUBLE_EQ(lines[0]["baseline"]["mean"].get<double>(), 100.0);
    EXPECT_EQ(lines[0]["baseline"]["count"], 200);
}

TEST_F(AnomalyFileSinkTest, CooldownSuppressesRepeatedMediumAnomalies) {
    AnomalyFileSink sink(output_path, false, 60, console);

    EXPECT_TRUE(sink.dispatch(makeAnomaly("k:", analytics::AnomalySeverity::MEDIUM, 1000)));
    EXPECT_FALSE(sink.dispatch(makeAnomaly("k:", analytics::AnomalySeverity::MEDIUM, 30000)));
    // Other keys have their own cooldown
    EXPECT_TRUE(sink.dispatch(makeAnomaly("other:", analytics::AnomalySeverity::MEDIUM, 30000)));
    // HIGH is never held back
    EXPECT_TRUE(sink.dispatch(makeAnomaly("k:", analytics::AnomalySeverity::HIGH, 31000)));
    // Cooldown restarts from the last written anomaly
    EXPECT_FALSE(sink.dispatch(makeAnomaly("k:", analytics::AnomalySeverity::MEDIUM, 62000)));
    EXPECT_TRUE(sink.dispatch(makeAnomaly("k:", analytics::AnomalySeverity::MEDIUM, 91000)));

    EXPECT_EQ(sink.written(), 4u);
    EXPECT_EQ(sink.suppressed(), 2u);
    EXPECT_EQ(readLines().size(), 4u);
    EXPECT_TRUE(console.str().empty());
}

TEST_F(AnomalyFileSinkTest, AttachesToEventChannel) {
    analytics::EventChannel events;
    AnomalyFileSink sink("", true, 0, console);
    EXPECT_FALSE(sink.file_open());

    auto id = sink.attach(events);
    events.publish_anomaly(makeAnomaly("k:", analytics::AnomalySeverity::HIGH, 1));
    EXPECT_EQ(sink.written(), 1u);

    EXPECT_TRUE(events.unsubscribe(id));
    events.publish_anomaly(makeAnomaly("k:", analytics::AnomalySeverity::HIGH, 2));
    EXPECT_EQ(sink.written(), 1u);
}

TEST(JsonFormatterTest, InfiniteDeviationIsWrittenAsString) {
    analytics::AnomalyEvent event;
    event.metric_key = "flat:";
    event.severity = analytics::AnomalySeverity::HIGH;
    event.deviation = std::numeric_limits<double>::infinity();

    auto j = JsonFormatter::anomaly_to_json_object(event);
    EXPECT_EQ(j["deviation"], "inf");
    EXPECT_EQ(j["severity"], "high");
}

TEST(JsonFormatterTest, CurrentMetricsUseWindowLabels) {
    analytics::CurrentMetrics metrics;
    metrics["cpu:"][60] = 12.5;
    metrics["cpu:"][300] = std::nullopt;

    auto j = JsonFormatter::current_metrics_to_json(metrics);
    EXPECT_DOUBLE_EQ(j["cpu:"]["60s"].get<double>(), 12.5);
    EXPECT_TRUE(j["cpu:"]["300s"].is_null());
    EXPECT_TRUE(JsonFormatter::current_metrics_to_json({}).empty());
}

TEST(JsonFormatterTest, AggregationFields) {
    analytics::Aggregation aggregation;
    aggregation.count = 3;
    aggregation.avg = 2.0;
    aggregation.p95 = 3.0;
    aggregation.end_time_ms = 9000;

    auto j = JsonFormatter::aggregation_to_json_object(aggregation);
    EXPECT_EQ(j["count"], 3);
    EXPECT_DOUBLE_EQ(j["p95"].get<double>(), 3.0);
    EXPECT_EQ(j["end_time_ms"], 9000);
}
