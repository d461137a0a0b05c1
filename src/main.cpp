#include "analytics/analytics_engine.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/prometheus_metrics_exporter.hpp"
#include "io/anomaly_dispatch/anomaly_file_sink.hpp"
#include "io/metric_readers/metric_line_parser.hpp"
#include "storage/in_memory_storage_backend.hpp"
#include "storage/mongo_storage_backend.hpp"
#include "storage/retrying_storage_backend.hpp"
#include "utils/error_recovery.hpp"
#include "utils/json_formatter.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM) {
    g_shutdown_requested = true;
  } else if (signum == SIGHUP) {
    g_reload_config_requested = true;
  }
}

using LineQueue = ThreadSafeQueue<std::string>;

// --- Reader thread function ---
// Owns its queue reference so it can be detached while blocked on stdin.
void metric_reader_thread(std::string input_path,
                          std::shared_ptr<LineQueue> queue,
                          std::shared_ptr<std::atomic<bool>> finished) {
  std::ifstream file;
  std::istream *input = &std::cin;
  if (!input_path.empty()) {
    file.open(input_path);
    if (!file.is_open()) {
      LOG(LogLevel::FATAL, LogComponent::IO_READER,
          "Failed to open metrics input file: " << input_path);
      finished->store(true);
      queue->shutdown();
      return;
    }
    input = &file;
  }

  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Metric reader started on "
          << (input_path.empty() ? std::string("stdin") : input_path));

  uint64_t lines_read = 0;
  std::string line;
  while (!g_shutdown_requested && std::getline(*input, line)) {
    queue->push(std::move(line));
    ++lines_read;
  }

  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Metric reader finished after " << lines_read << " lines.");
  finished->store(true);
  queue->shutdown();
}

// --- Worker thread function ---
void worker_thread(int worker_id, LineQueue &queue,
                   analytics::AnalyticsEngine &engine) {
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Worker thread " << worker_id << " started.");

  uint64_t recorded = 0;
  uint64_t skipped = 0;
  while (true) {
    auto line = queue.wait_and_pop_for(std::chrono::milliseconds(200));
    if (!line) {
      if (queue.is_shutdown() && queue.empty())
        break;
      continue;
    }

    auto parsed = parse_metric_line(*line);
    if (!parsed) {
      ++skipped;
      continue;
    }
    if (engine.record_metric(parsed->name, parsed->value, parsed->tags,
                             parsed->timestamp_ms))
      ++recorded;
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Worker " << worker_id << " finished. Recorded " << recorded
                << " samples, skipped " << skipped << " lines.");
}

std::shared_ptr<storage::IStorageBackend>
make_storage_backend(const Config::AppConfig &config) {
  std::shared_ptr<storage::IStorageBackend> backend;
  if (config.storage.backend == "mongodb") {
    backend = std::make_shared<storage::MongoStorageBackend>(
        config.mongo_storage, config.storage.baseline_lookback_days);
  } else {
    backend = std::make_shared<storage::InMemoryStorageBackend>(
        config.storage.baseline_lookback_days);
  }

  error_recovery::RecoveryConfig retry_config;
  retry_config.max_retries = config.storage.max_retries;
  retry_config.base_delay =
      std::chrono::milliseconds(config.storage.base_delay_ms);
  retry_config.backoff_multiplier = config.storage.backoff_multiplier;
  retry_config.max_delay = std::chrono::milliseconds(config.storage.max_delay_ms);

  LOG(LogLevel::INFO, LogComponent::STORAGE,
      "Using " << backend->get_name() << " storage with up to "
               << retry_config.max_retries << " retries");
  return std::make_shared<storage::RetryingStorageBackend>(backend,
                                                           retry_config);
}

std::shared_ptr<prometheus::PrometheusMetricsExporter>
make_metrics_exporter(const Config::AppConfig &config) {
  if (!config.prometheus.enabled)
    return nullptr;

  prometheus::PrometheusMetricsExporter::Config prometheus_config;
  prometheus_config.host = config.prometheus.host;
  prometheus_config.port = config.prometheus.port;
  prometheus_config.metrics_path = config.prometheus.metrics_path;
  prometheus_config.health_path = config.prometheus.health_path;
  return std::make_shared<prometheus::PrometheusMetricsExporter>(
      prometheus_config);
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  config_manager.load_configuration(config_file_to_load);

  auto current_config = config_manager.get_config();
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE, "metrics_sentinel starting up...");
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());

  std::unique_ptr<analytics::AnalyticsEngine> engine;
  std::shared_ptr<prometheus::PrometheusMetricsExporter> metrics_exporter;
  try {
    engine = std::make_unique<analytics::AnalyticsEngine>(
        *current_config, make_storage_backend(*current_config));

    metrics_exporter = make_metrics_exporter(*current_config);
    if (metrics_exporter) {
      engine->set_metrics_exporter(metrics_exporter);
      analytics::AnalyticsEngine *engine_ptr = engine.get();
      metrics_exporter->set_state_provider([engine_ptr]() {
        return JsonFormatter::current_metrics_to_json(
            engine_ptr->get_current_metrics());
      });
      if (!metrics_exporter->start_server()) {
        LOG(LogLevel::FATAL, LogComponent::CORE,
            "Failed to start the Prometheus metrics server. Exiting.");
        return 1;
      }
    }

    engine->start();
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to start the analytics engine: " << e.what() << ". Exiting.");
    return 1;
  }

  AnomalyFileSink anomaly_sink(current_config->anomaly_output_path,
                               current_config->alerts_to_stdout,
                               current_config->anomaly_cooldown_seconds);
  anomaly_sink.attach(engine->events());
  engine->events().on_error([](const analytics::ErrorInfo &error) {
    LOG(LogLevel::WARN, LogComponent::CORE,
        "Engine error in " << error.component << "." << error.operation
                           << (error.metric_key.empty()
                                   ? std::string()
                                   : " [" + error.metric_key + "]")
                           << ": " << error.message);
  });
  engine->events().on_aggregation([](const analytics::AggregationEvent &event) {
    LOG(LogLevel::DEBUG, LogComponent::ENGINE_AGGREGATE,
        "Aggregated " << event.metric_key << " ("
                      << analytics::trigger_to_string(event.trigger) << "): "
                      << JsonFormatter::aggregation_to_json_object(
                             event.aggregation)
                             .dump());
  });

  auto line_queue = std::make_shared<LineQueue>();
  auto reader_finished = std::make_shared<std::atomic<bool>>(false);
  std::thread reader_thread(metric_reader_thread,
                            current_config->metrics_input_path, line_queue,
                            reader_finished);

  const unsigned int num_workers = current_config->ingest_worker_threads;
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Initializing with " << num_workers << " worker threads.");
  std::vector<std::thread> worker_threads;
  for (unsigned int i = 0; i < num_workers; ++i)
    worker_threads.emplace_back(worker_thread, static_cast<int>(i),
                                std::ref(*line_queue), std::ref(*engine));

  while (!g_shutdown_requested && !reader_finished->load()) {
    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CONFIG,
          "SIGHUP received, reloading " << config_file_to_load);
      if (config_manager.load_configuration(config_file_to_load)) {
        current_config = config_manager.get_config();
        LogManager::instance().configure(current_config->logging);
        LOG(LogLevel::INFO, LogComponent::CONFIG,
            "Logging levels reapplied. Engine, storage and metrics server "
            "settings take effect on restart.");
      } else {
        LOG(LogLevel::ERROR, LogComponent::CONFIG,
            "Reload failed, keeping the previous configuration.");
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown sequence started.");
  line_queue->shutdown();

  // A reader blocked on an interactive stdin cannot be interrupted.
  if (reader_finished->load())
    reader_thread.join();
  else
    reader_thread.detach();

  for (auto &worker : worker_threads)
    worker.join();

  engine->shutdown();
  if (metrics_exporter)
    metrics_exporter->stop_server();

  auto stats = engine->get_stats();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Final stats: recorded=" << stats.samples_recorded
                               << " rejected=" << stats.samples_rejected
                               << " anomalies=" << stats.anomalies_detected
                               << " aggregations=" << stats.aggregations
                               << " persist_failures=" << stats.persist_failures
                               << " anomalies_written=" << anomaly_sink.written());
  LOG(LogLevel::INFO, LogComponent::CORE, "metrics_sentinel stopped.");
  return 0;
}
