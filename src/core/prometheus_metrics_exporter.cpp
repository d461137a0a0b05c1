#include "prometheus_metrics_exporter.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace prometheus {

namespace {

void atomic_add(std::atomic<double> &target, double value) {
  double expected = target.load();
  while (!target.compare_exchange_weak(expected, expected + value)) {
  }
}

void add_cors_headers(httplib::Response &res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
  res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

} // namespace

PrometheusMetricsExporter::PrometheusMetricsExporter(const Config &config)
    : config_(config) {}

PrometheusMetricsExporter::~PrometheusMetricsExporter() { stop_server(); }

void PrometheusMetricsExporter::ensure_unregistered(
    const std::string &name) const {
  if (counters_.count(name) || gauges_.count(name) || histograms_.count(name))
    throw std::invalid_argument("Metric '" + name + "' already registered");
}

void PrometheusMetricsExporter::register_counter(
    const std::string &name, const std::string &help,
    const std::vector<std::string> &label_names) {
  validate_metric_name(name);
  validate_label_names(label_names);

  std::unique_lock<std::shared_mutex> lock(metrics_mutex_);
  ensure_unregistered(name);

  auto counter = std::make_unique<SeriesMetric>();
  counter->name = name;
  counter->help = help;
  counter->label_names = label_names;
  counters_[name] = std::move(counter);
}

void PrometheusMetricsExporter::register_gauge(
    const std::string &name, const std::string &help,
    const std::vector<std::string> &label_names) {
  validate_metric_name(name);
  validate_label_names(label_names);

  std::unique_lock<std::shared_mutex> lock(metrics_mutex_);
  ensure_unregistered(name);

  auto gauge = std::make_unique<SeriesMetric>();
  gauge->name = name;
  gauge->help = help;
  gauge->label_names = label_names;
  gauges_[name] = std::move(gauge);
}

void PrometheusMetricsExporter::register_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &buckets,
    const std::vector<std::string> &label_names) {
  validate_metric_name(name);
  validate_label_names(label_names);
  if (std::find(label_names.begin(), label_names.end(), "le") !=
      label_names.end())
    throw std::invalid_argument("Histogram label 'le' is reserved");

  std::unique_lock<std::shared_mutex> lock(metrics_mutex_);
  ensure_unregistered(name);

  auto histogram = std::make_unique<HistogramMetric>();
  histogram->name = name;
  histogram->help = help;
  histogram->label_names = label_names;
  histogram->bucket_bounds =
      buckets.empty() ? get_default_histogram_buckets() : buckets;

  auto &bounds = histogram->bucket_bounds;
  std::sort(bounds.begin(), bounds.end());
  bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());
  if (bounds.back() != std::numeric_limits<double>::infinity())
    bounds.push_back(std::numeric_limits<double>::infinity());

  histograms_[name] = std::move(histogram);
}

bool PrometheusMetricsExporter::has_metric(const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  return counters_.count(name) || gauges_.count(name) ||
         histograms_.count(name);
}

void PrometheusMetricsExporter::check_labels(
    const std::string &kind, const std::string &name,
    const std::vector<std::string> &label_names, const Labels &labels) {
  if (labels.size() != label_names.size())
    throw std::invalid_argument("Label count mismatch for " + kind + " '" +
                                name + "'");
  for (const auto &label_name : label_names) {
    if (labels.find(label_name) == labels.end())
      throw std::invalid_argument("Missing label '" + label_name + "' for " +
                                  kind + " '" + name + "'");
  }
}

void PrometheusMetricsExporter::increment_counter(const std::string &name,
                                                  const Labels &labels,
                                                  double value) {
  if (value < 0)
    throw std::invalid_argument("Counter increment value must be non-negative");

  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  auto it = counters_.find(name);
  if (it == counters_.end())
    throw std::invalid_argument("Counter '" + name + "' not found");

  auto &counter = *it->second;
  check_labels("counter", name, counter.label_names, labels);

  {
    std::shared_lock<std::shared_mutex> series_lock(counter.mutex);
    auto series = counter.values.find(labels);
    if (series != counter.values.end()) {
      atomic_add(series->second, value);
      return;
    }
  }

  std::unique_lock<std::shared_mutex> series_lock(counter.mutex);
  auto [series, inserted] = counter.values.try_emplace(labels, 0.0);
  atomic_add(series->second, value);
}

void PrometheusMetricsExporter::set_gauge(const std::string &name,
                                          double value, const Labels &labels) {
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  auto it = gauges_.find(name);
  if (it == gauges_.end())
    throw std::invalid_argument("Gauge '" + name + "' not found");

  auto &gauge = *it->second;
  check_labels("gauge", name, gauge.label_names, labels);

  std::unique_lock<std::shared_mutex> series_lock(gauge.mutex);
  auto [series, inserted] = gauge.values.try_emplace(labels, 0.0);
  series->second.store(value);
}

void PrometheusMetricsExporter::observe_histogram(const std::string &name,
                                                  double value,
                                                  const Labels &labels) {
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);
  auto it = histograms_.find(name);
  if (it == histograms_.end())
    throw std::invalid_argument("Histogram '" + name + "' not found");

  auto &histogram = *it->second;
  check_labels("histogram", name, histogram.label_names, labels);

  std::unique_lock<std::shared_mutex> series_lock(histogram.mutex);
  auto &series = histogram.series[labels];
  if (series.bucket_counts.empty())
    series.bucket_counts.assign(histogram.bucket_bounds.size(), 0);

  // Buckets are cumulative.
  for (size_t i = 0; i < histogram.bucket_bounds.size(); ++i) {
    if (value <= histogram.bucket_bounds[i])
      ++series.bucket_counts[i];
  }
  series.sum += value;
  ++series.count;
}

bool PrometheusMetricsExporter::start_server() {
  if (server_running_.load())
    return true;

  server_ = std::make_unique<httplib::Server>();
  setup_http_handlers();

  int port = config_.port;
  if (config_.port == 0) {
    port = server_->bind_to_any_port(config_.host);
    if (port < 0)
      port = 0;
  } else if (!server_->bind_to_port(config_.host, config_.port)) {
    port = 0;
  }

  if (port == 0) {
    LOG(LogLevel::ERROR, LogComponent::METRICS_EXPORT,
        "Failed to bind metrics server on " << config_.host << ":"
                                            << config_.port);
    server_.reset();
    return false;
  }

  bound_port_.store(port);
  server_running_.store(true);
  server_thread_ = std::make_unique<std::thread>([this]() {
    if (!server_->listen_after_bind()) {
      LOG(LogLevel::WARN, LogComponent::METRICS_EXPORT,
          "Metrics server listen loop exited with an error");
    }
  });

  LOG(LogLevel::INFO, LogComponent::METRICS_EXPORT,
      "Metrics server listening on " << config_.host << ":" << port
                                     << config_.metrics_path);
  return true;
}

void PrometheusMetricsExporter::stop_server() {
  if (!server_running_.exchange(false))
    return;

  server_->stop();
  if (server_thread_ && server_thread_->joinable())
    server_thread_->join();
  server_thread_.reset();
  bound_port_.store(0);

  LOG(LogLevel::INFO, LogComponent::METRICS_EXPORT, "Metrics server stopped");
}

bool PrometheusMetricsExporter::is_running() const {
  return server_running_.load();
}

void PrometheusMetricsExporter::set_state_provider(StateProvider provider) {
  std::lock_guard<std::mutex> lock(state_provider_mutex_);
  state_provider_ = std::move(provider);
}

void PrometheusMetricsExporter::write_series(std::ostream &out,
                                             const std::string &type,
                                             const SeriesMetric &metric) const {
  std::shared_lock<std::shared_mutex> lock(metric.mutex);
  out << "# HELP " << metric.name << " " << metric.help << "\n";
  out << "# TYPE " << metric.name << " " << type << "\n";
  for (const auto &[labels, value] : metric.values) {
    out << metric.name << format_labels(labels) << " " << std::fixed
        << std::setprecision(6) << value.load() << "\n";
  }
}

std::string PrometheusMetricsExporter::generate_metrics_output() const {
  std::ostringstream output;
  std::shared_lock<std::shared_mutex> lock(metrics_mutex_);

  for (const auto &[name, counter] : counters_)
    write_series(output, "counter", *counter);
  for (const auto &[name, gauge] : gauges_)
    write_series(output, "gauge", *gauge);

  for (const auto &[name, histogram] : histograms_) {
    std::shared_lock<std::shared_mutex> histogram_lock(histogram->mutex);

    output << "# HELP " << name << " " << histogram->help << "\n";
    output << "# TYPE " << name << " histogram\n";

    for (const auto &[labels, series] : histogram->series) {
      for (size_t i = 0; i < histogram->bucket_bounds.size(); ++i) {
        auto bucket_labels = labels;
        double bound = histogram->bucket_bounds[i];
        bucket_labels["le"] = bound == std::numeric_limits<double>::infinity()
                                  ? "+Inf"
                                  : std::to_string(bound);
        output << name << "_bucket" << format_labels(bucket_labels) << " "
               << series.bucket_counts[i] << "\n";
      }
      output << name << "_sum" << format_labels(labels) << " " << std::fixed
             << std::setprecision(6) << series.sum << "\n";
      output << name << "_count" << format_labels(labels) << " "
             << series.count << "\n";
    }
  }

  return output.str();
}

std::vector<double>
PrometheusMetricsExporter::get_default_histogram_buckets() const {
  return {0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025,
          0.05,   0.1,   0.25,   0.5,   1.0,  2.5};
}

std::string
PrometheusMetricsExporter::escape_label_value(const std::string &value) const {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    switch (c) {
    case '\\':
      escaped += "\\\\";
      break;
    case '"':
      escaped += "\\\"";
      break;
    case '\n':
      escaped += "\\n";
      break;
    default:
      escaped += c;
    }
  }
  return escaped;
}

std::string
PrometheusMetricsExporter::format_labels(const Labels &labels) const {
  if (labels.empty())
    return "";

  std::ostringstream formatted;
  formatted << "{";
  bool first = true;
  for (const auto &[key, value] : labels) {
    if (!first)
      formatted << ",";
    formatted << key << "=\"" << escape_label_value(value) << "\"";
    first = false;
  }
  formatted << "}";
  return formatted.str();
}

void PrometheusMetricsExporter::validate_metric_name(
    const std::string &name) const {
  if (name.empty())
    throw std::invalid_argument("Metric name cannot be empty");

  static const std::regex name_regex("^[a-zA-Z_:][a-zA-Z0-9_:]*$");
  if (!std::regex_match(name, name_regex))
    throw std::invalid_argument("Invalid metric name: " + name);
}

void PrometheusMetricsExporter::validate_label_names(
    const std::vector<std::string> &label_names) const {
  static const std::regex label_regex("^[a-zA-Z_][a-zA-Z0-9_]*$");

  for (const auto &label_name : label_names) {
    if (label_name.empty())
      throw std::invalid_argument("Label name cannot be empty");
    if (!std::regex_match(label_name, label_regex))
      throw std::invalid_argument("Invalid label name: " + label_name);
    if (label_name.compare(0, 2, "__") == 0)
      throw std::invalid_argument("Label name cannot start with '__': " +
                                  label_name);
  }
}

void PrometheusMetricsExporter::setup_http_handlers() {
  server_->Get(config_.metrics_path,
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_metrics_request(req, res);
               });
  server_->Get(config_.health_path,
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_health_request(req, res);
               });
  server_->Get(config_.current_metrics_path,
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_current_metrics_request(req, res);
               });
}

void PrometheusMetricsExporter::handle_metrics_request(
    [[maybe_unused]] const httplib::Request &req, httplib::Response &res) {
  try {
    res.set_content(generate_metrics_output(),
                    "text/plain; version=0.0.4; charset=utf-8");
    res.status = 200;
    add_cors_headers(res);
    res.set_header("Cache-Control",
                   "no-store, no-cache, must-revalidate, max-age=0");
  } catch (const std::exception &e) {
    res.set_content("Error generating metrics: " + std::string(e.what()),
                    "text/plain");
    res.status = 500;
  }
}

void PrometheusMetricsExporter::handle_health_request(
    [[maybe_unused]] const httplib::Request &req, httplib::Response &res) {
  res.set_content("OK", "text/plain");
  res.status = 200;
  add_cors_headers(res);
}

void PrometheusMetricsExporter::handle_current_metrics_request(
    const httplib::Request &req, httplib::Response &res) {
  StateProvider provider;
  {
    std::lock_guard<std::mutex> lock(state_provider_mutex_);
    provider = state_provider_;
  }

  if (!provider) {
    res.set_content("{\"error\": \"Engine not attached\"}",
                    "application/json");
    res.status = 503;
    return;
  }

  try {
    res.set_content(provider().dump(2), "application/json");
    res.status = 200;
    add_cors_headers(res);
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::METRICS_EXPORT,
        "Current metrics request from " << req.remote_addr
                                        << " failed: " << e.what());
    nlohmann::json error = {{"error", e.what()}};
    res.set_content(error.dump(), "application/json");
    res.status = 500;
  }
}

} // namespace prometheus
