#ifndef PROMETHEUS_METRICS_EXPORTER_HPP
#define PROMETHEUS_METRICS_EXPORTER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <httplib.h>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace prometheus {

using Labels = std::map<std::string, std::string>;

/**
 * Thread-safe Prometheus text-format exporter. Holds counters, gauges and
 * histograms with labels and serves them over HTTP next to a health check
 * and a JSON view of the engine's live moving averages.
 */
class PrometheusMetricsExporter {
public:
  struct Config {
    std::string host;
    int port; // 0 binds any free port, see bound_port()
    std::string metrics_path;
    std::string health_path;
    std::string current_metrics_path;

    Config()
        : host("0.0.0.0"), port(9090), metrics_path("/metrics"),
          health_path("/health"),
          current_metrics_path("/api/v1/metrics/current") {}
  };

  // Produces the JSON body for current_metrics_path.
  using StateProvider = std::function<nlohmann::json()>;

  explicit PrometheusMetricsExporter(const Config &config = Config{});
  ~PrometheusMetricsExporter();

  PrometheusMetricsExporter(const PrometheusMetricsExporter &) = delete;
  PrometheusMetricsExporter &
  operator=(const PrometheusMetricsExporter &) = delete;

  void register_counter(const std::string &name, const std::string &help,
                        const std::vector<std::string> &label_names = {});
  void register_gauge(const std::string &name, const std::string &help,
                      const std::vector<std::string> &label_names = {});
  void register_histogram(const std::string &name, const std::string &help,
                          const std::vector<double> &buckets = {},
                          const std::vector<std::string> &label_names = {});

  bool has_metric(const std::string &name) const;

  void increment_counter(const std::string &name, const Labels &labels = {},
                         double value = 1.0);
  void set_gauge(const std::string &name, double value,
                 const Labels &labels = {});
  void observe_histogram(const std::string &name, double value,
                         const Labels &labels = {});

  // Binds synchronously, so a false return means the port was unavailable.
  bool start_server();
  void stop_server();
  bool is_running() const;
  int bound_port() const { return bound_port_.load(); }

  void set_state_provider(StateProvider provider);

  std::string generate_metrics_output() const;

private:
  struct SeriesMetric {
    std::string name;
    std::string help;
    std::vector<std::string> label_names;
    std::map<Labels, std::atomic<double>> values;
    mutable std::shared_mutex mutex;
  };

  struct HistogramSeries {
    std::vector<uint64_t> bucket_counts;
    double sum = 0.0;
    uint64_t count = 0;
  };

  struct HistogramMetric {
    std::string name;
    std::string help;
    std::vector<std::string> label_names;
    std::vector<double> bucket_bounds; // sorted, ends with +Inf
    std::map<Labels, HistogramSeries> series;
    mutable std::shared_mutex mutex;
  };

  Config config_;

  std::unordered_map<std::string, std::unique_ptr<SeriesMetric>> counters_;
  std::unordered_map<std::string, std::unique_ptr<SeriesMetric>> gauges_;
  std::unordered_map<std::string, std::unique_ptr<HistogramMetric>> histograms_;
  mutable std::shared_mutex metrics_mutex_;

  std::unique_ptr<httplib::Server> server_;
  std::unique_ptr<std::thread> server_thread_;
  std::atomic<bool> server_running_{false};
  std::atomic<int> bound_port_{0};

  StateProvider state_provider_;
  mutable std::mutex state_provider_mutex_;

  void ensure_unregistered(const std::string &name) const;
  static void check_labels(const std::string &kind, const std::string &name,
                           const std::vector<std::string> &label_names,
                           const Labels &labels);
  void write_series(std::ostream &out, const std::string &type,
                    const SeriesMetric &metric) const;

  std::vector<double> get_default_histogram_buckets() const;
  std::string escape_label_value(const std::string &value) const;
  std::string format_labels(const Labels &labels) const;
  void validate_metric_name(const std::string &name) const;
  void validate_label_names(const std::vector<std::string> &label_names) const;

  void setup_http_handlers();
  void handle_metrics_request(const httplib::Request &req,
                              httplib::Response &res);
  void handle_health_request(const httplib::Request &req,
                             httplib::Response &res);
  void handle_current_metrics_request(const httplib::Request &req,
                                      httplib::Response &res);
};

} // namespace prometheus

#endif // PROMETHEUS_METRICS_EXPORTER_HPP
