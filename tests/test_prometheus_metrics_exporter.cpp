#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <regex>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "analytics/analytics_engine.hpp"
#include "analytics/engine_metrics.hpp"
#include "core/prometheus_metrics_exporter.hpp"
#include "storage/in_memory_storage_backend.hpp"

class PrometheusMetricsExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Port 0 lets the OS pick a free port for every test
        config_.host = "127.0.0.1";
        config_.port = 0;
        exporter_ = std::make_unique<prometheus::PrometheusMetricsExporter>(config_);
    }

    void TearDown() override {
        if (exporter_) {
            exporter_->stop_server();
        }
    }

    prometheus::PrometheusMetricsExporter::Config config_;
    std::unique_ptr<prometheus::PrometheusMetricsExporter> exporter_;
};

TEST_F(PrometheusMetricsExporterTest, RegisterCounter) {
    EXPECT_NO_THROW(exporter_->register_counter("samples_total", "Samples"));
    EXPECT_NO_THROW(exporter_->register_counter("rejected_total", "Rejected samples", {"reason"}));
    EXPECT_TRUE(exporter_->has_metric("samples_total"));
    EXPECT_FALSE(exporter_->has_metric("unknown_total"));

    // Duplicate registration should throw
    EXPECT_THROW(exporter_->register_counter("samples_total", "Duplicate counter"), std::invalid_argument);
}

TEST_F(PrometheusMetricsExporterTest, NamesAreUniqueAcrossTypes) {
    exporter_->register_counter("shared_name", "Counter");
    EXPECT_THROW(exporter_->register_gauge("shared_name", "Gauge"), std::invalid_argument);
    EXPECT_THROW(exporter_->register_histogram("shared_name", "Histogram"), std::invalid_argument);
}

TEST_F(PrometheusMetricsExporterTest, RegisterHistogram) {
    EXPECT_NO_THROW(exporter_->register_histogram("duration_seconds", "Duration"));

    std::vector<double> buckets = {0.1, 0.5, 1.0, 5.0};
    EXPECT_NO_THROW(exporter_->register_histogram("custom_seconds", "Custom buckets", buckets));
    EXPECT_NO_THROW(exporter_->register_histogram("labelled_seconds", "With labels", {}, {"trigger"}));

    // "le" is reserved for bucket bounds
    EXPECT_THROW(exporter_->register_histogram("bad_seconds", "Reserved label", {}, {"le"}), std::invalid_argument);
}

TEST_F(PrometheusMetricsExporterTest, UpdatesValidateNamesAndLabels) {
    exporter_->register_counter("anomalies_total", "Anomalies", {"severity"});
    exporter_->register_gauge("tracked_keys", "Keys");
    exporter_->register_histogram("duration_seconds", "Duration");

    EXPECT_THROW(exporter_->increment_counter("missing_total"), std::invalid_argument);
    EXPECT_THROW(exporter_->increment_counter("anomalies_total"), std::invalid_argument);
    EXPECT_THROW(exporter_->increment_counter("anomalies_total", {{"kind", "high"}}), std::invalid_argument);
    EXPECT_THROW(exporter_->increment_counter("anomalies_total", {{"severity", "high"}}, -1.0), std::invalid_argument);
    EXPECT_THROW(exporter_->set_gauge("missing", 1.0), std::invalid_argument);
    EXPECT_THROW(exporter_->set_gauge("tracked_keys", 1.0, {{"extra", "x"}}), std::invalid_argument);
    EXPECT_THROW(exporter_->observe_histogram("missing", 0.1), std::invalid_argument);

    EXPECT_NO_THROW(exporter_->increment_counter("anomalies_total", {{"severity", "high"}}));
}

TEST_F(PrometheusMetricsExporterTest, MetricsOutput) {
    exporter_->register_counter("test_counter", "Test counter");
    exporter_->register_gauge("test_gauge", "Test gauge");
    exporter_->register_histogram("test_histogram", "Test histogram", {0.5, 1.0});

    exporter_->increment_counter("test_counter", {}, 5.0);
    exporter_->set_gauge("test_gauge", 42.5, {});
    exporter_->observe_histogram("test_histogram", 0.1, {});
    exporter_->observe_histogram("test_histogram", 1.5, {});

    std::string output = exporter_->generate_metrics_output();

    EXPECT_TRUE(output.find("# HELP test_counter Test counter") != std::string::npos);
    EXPECT_TRUE(output.find("# TYPE test_counter counter") != std::string::npos);
    EXPECT_TRUE(output.find("test_counter 5.000000") != std::string::npos);

    EXPECT_TRUE(output.find("# TYPE test_gauge gauge") != std::string::npos);
    EXPECT_TRUE(output.find("test_gauge 42.500000") != std::string::npos);

    // Buckets are cumulative
    EXPECT_TRUE(output.find("# TYPE test_histogram histogram") != std::string::npos);
    EXPECT_TRUE(output.find("test_histogram_bucket{le=\"0.500000\"} 1") != std::string::npos);
    EXPECT_TRUE(output.find("test_histogram_bucket{le=\"1.000000\"} 1") != std::string::npos);
    EXPECT_TRUE(output.find("test_histogram_bucket{le=\"+Inf\"} 2") != std::string::npos);
    EXPECT_TRUE(output.find("test_histogram_sum 1.600000") != std::string::npos);
    EXPECT_TRUE(output.find("test_histogram_count 2") != std::string::npos);
}

TEST_F(PrometheusMetricsExporterTest, MetricsOutputWithLabels) {
    exporter_->register_counter("rejected_total", "Rejected samples", {"reason"});
    exporter_->register_gauge("window_average", "Window average", {"metric", "window"});

    exporter_->increment_counter("rejected_total", {{"reason", "invalid_value"}}, 3);
    exporter_->increment_counter("rejected_total", {{"reason", "not_running"}});
    exporter_->set_gauge("window_average", 12.5, {{"metric", "cpu"}, {"window", "60s"}});

    std::string output = exporter_->generate_metrics_output();

    EXPECT_TRUE(output.find("rejected_total{reason=\"invalid_value\"} 3.000000") != std::string::npos);
    EXPECT_TRUE(output.find("rejected_total{reason=\"not_running\"} 1.000000") != std::string::npos);
    EXPECT_TRUE(output.find("window_average{metric=\"cpu\",window=\"60s\"} 12.500000") != std::string::npos);
}

TEST_F(PrometheusMetricsExporterTest, InvalidMetricNames) {
    EXPECT_THROW(exporter_->register_counter("", "Empty name"), std::invalid_argument);
    EXPECT_THROW(exporter_->register_counter("123invalid", "Starts with number"), std::invalid_argument);
    EXPECT_THROW(exporter_->register_counter("invalid-name", "Contains dash"), std::invalid_argument);
    EXPECT_THROW(exporter_->register_counter("invalid.name", "Contains dot"), std::invalid_argument);

    EXPECT_NO_THROW(exporter_->register_counter("valid:name", "Valid name with colon"));
    EXPECT_NO_THROW(exporter_->register_counter("_valid_name", "Valid name starting with underscore"));
}

TEST_F(PrometheusMetricsExporterTest, InvalidLabelNames) {
    EXPECT_THROW(exporter_->register_counter("test", "Test", {""}), std::invalid_argument);
    EXPECT_THROW(exporter_->register_counter("test", "Test", {"invalid-name"}), std::invalid_argument);
    EXPECT_THROW(exporter_->register_counter("test", "Test", {"__reserved"}), std::invalid_argument);
    EXPECT_NO_THROW(exporter_->register_counter("test", "Test", {"valid_name"}));
}

TEST_F(PrometheusMetricsExporterTest, LabelValueEscaping) {
    exporter_->register_counter("test_counter", "Test counter", {"label"});

    exporter_->increment_counter("test_counter", {{"label", "value with \"quotes\""}});
    exporter_->increment_counter("test_counter", {{"label", "value with\nnewlines"}});
    exporter_->increment_counter("test_counter", {{"label", "value with\\backslashes"}});

    std::string output = exporter_->generate_metrics_output();

    EXPECT_TRUE(output.find("label=\"value with \\\"quotes\\\"\"") != std::string::npos);
    EXPECT_TRUE(output.find("label=\"value with\\nnewlines\"") != std::string::npos);
    EXPECT_TRUE(output.find("label=\"value with\\\\backslashes\"") != std::string::npos);
}

TEST_F(PrometheusMetricsExporterTest, ServerEndpoints) {
    ASSERT_TRUE(exporter_->start_server());
    EXPECT_TRUE(exporter_->is_running());
    int port = exporter_->bound_port();
    ASSERT_GT(port, 0);

    httplib::Client client("127.0.0.1", port);
    client.set_connection_timeout(1, 0);

    auto health_res = client.Get("/health");
    ASSERT_TRUE(health_res);
    EXPECT_EQ(health_res->status, 200);
    EXPECT_EQ(health_res->body, "OK");

    exporter_->register_counter("test_counter", "Test counter");
    exporter_->increment_counter("test_counter", {}, 1.0);

    auto metrics_res = client.Get("/metrics");
    ASSERT_TRUE(metrics_res);
    EXPECT_EQ(metrics_res->status, 200);
    EXPECT_TRUE(metrics_res->body.find("test_counter 1.000000") != std::string::npos);

    // No engine attached yet
    auto current_res = client.Get("/api/v1/metrics/current");
    ASSERT_TRUE(current_res);
    EXPECT_EQ(current_res->status, 503);

    exporter_->set_state_provider([] {
        return nlohmann::json{{"cpu:", {{"60s", 12.5}}}};
    });
    current_res = client.Get("/api/v1/metrics/current");
    ASSERT_TRUE(current_res);
    EXPECT_EQ(current_res->status, 200);
    auto body = nlohmann::json::parse(current_res->body);
    EXPECT_DOUBLE_EQ(body["cpu:"]["60s"].get<double>(), 12.5);

    exporter_->stop_server();
    EXPECT_FALSE(exporter_->is_running());
    EXPECT_EQ(exporter_->bound_port(), 0);
}

TEST_F(PrometheusMetricsExporterTest, ServerCanBeRestarted) {
    ASSERT_TRUE(exporter_->start_server());
    exporter_->stop_server();
    ASSERT_TRUE(exporter_->start_server());
    EXPECT_TRUE(exporter_->is_running());
}

TEST_F(PrometheusMetricsExporterTest, ThreadSafety) {
    exporter_->register_counter("concurrent_counter", "Concurrent counter");
    exporter_->register_gauge("concurrent_gauge", "Concurrent gauge");

    const int num_threads = 10;
    const int operations_per_thread = 100;

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([this, operations_per_thread]() {
            for (int j = 0; j < operations_per_thread; ++j) {
                exporter_->increment_counter("concurrent_counter", {}, 1.0);
                exporter_->set_gauge("concurrent_gauge", static_cast<double>(j), {});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::string output = exporter_->generate_metrics_output();
    std::regex counter_regex(R"(concurrent_counter\s+([\d\.]+))");
    std::smatch match;
    ASSERT_TRUE(std::regex_search(output, match, counter_regex));
    EXPECT_DOUBLE_EQ(std::stod(match[1].str()),
                     static_cast<double>(num_threads * operations_per_thread));
}

TEST_F(PrometheusMetricsExporterTest, EngineMetricsRegisterOnce) {
    auto shared = std::shared_ptr<prometheus::PrometheusMetricsExporter>(std::move(exporter_));

    analytics::EngineMetrics first;
    analytics::EngineMetrics second;
    EXPECT_FALSE(first.attached());
    first.sample_recorded(); // no exporter yet

    first.set_exporter(shared);
    second.set_exporter(shared);
    EXPECT_TRUE(first.attached());
    EXPECT_TRUE(second.attached());

    first.sample_recorded();
    second.sample_recorded();
    first.sample_rejected("invalid_value");
    first.anomaly_detected(analytics::AnomalySeverity::HIGH);
    first.aggregation_completed(analytics::AggregationTrigger::BUFFER_OVERFLOW);
    first.set_tracked_keys(3);

    std::string output = shared->generate_metrics_output();
    EXPECT_TRUE(output.find("metrics_sentinel_samples_recorded_total 2.000000") != std::string::npos);
    EXPECT_TRUE(output.find("metrics_sentinel_samples_rejected_total{reason=\"invalid_value\"} 1.000000") != std::string::npos);
    EXPECT_TRUE(output.find("metrics_sentinel_anomalies_total{severity=\"high\"} 1.000000") != std::string::npos);
    EXPECT_TRUE(output.find("metrics_sentinel_aggregations_total{trigger=\"overflow\"} 1.000000") != std::string::npos);
    EXPECT_TRUE(output.find("metrics_sentinel_tracked_keys 3.000000") != std::string::npos);
}

TEST_F(PrometheusMetricsExporterTest, EngineMetricsToleratesConflictingFamilies) {
    auto shared = std::shared_ptr<prometheus::PrometheusMetricsExporter>(std::move(exporter_));
    // Another component already owns this name with a different type and labels
    shared->register_gauge("metrics_sentinel_samples_recorded_total", "Foreign gauge", {"source"});

    analytics::EngineMetrics metrics;
    metrics.set_exporter(shared);
    EXPECT_TRUE(metrics.attached());
    EXPECT_TRUE(shared->has_metric("metrics_sentinel_anomalies_total"));
    EXPECT_TRUE(shared->has_metric("metrics_sentinel_tracked_keys"));

    EXPECT_NO_THROW(metrics.sample_recorded());
    EXPECT_NO_THROW(metrics.anomaly_detected(analytics::AnomalySeverity::MEDIUM));

    std::string output = shared->generate_metrics_output();
    EXPECT_TRUE(output.find("metrics_sentinel_anomalies_total{severity=\"medium\"} 1.000000") != std::string::npos);

    Config::AppConfig config;
    config.engine.window_sizes_seconds = {60};
    config.engine.aggregation_interval_ms = 3600000;
    config.engine.retention_enabled = false;
    analytics::AnalyticsEngine engine(config, std::make_shared<storage::InMemoryStorageBackend>(0));
    engine.set_metrics_exporter(shared);
    engine.start();
    EXPECT_NO_THROW(EXPECT_TRUE(engine.record_metric("cpu", 1.0)));
    EXPECT_EQ(engine.get_stats().samples_recorded, 1u);
    engine.shutdown();
}
