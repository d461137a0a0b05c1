#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *METRICS_INPUT_PATH = "metrics_input_path";
constexpr const char *ALERTS_TO_STDOUT = "alerts_to_stdout";
constexpr const char *ANOMALY_OUTPUT_PATH = "anomaly_output_path";
constexpr const char *ANOMALY_COOLDOWN_SECONDS = "anomaly_cooldown_seconds";
constexpr const char *INGEST_WORKER_THREADS = "ingest_worker_threads";

// Engine Settings
constexpr const char *EN_WINDOW_SIZES_SECONDS = "window_sizes_seconds";
constexpr const char *EN_AGGREGATION_INTERVAL_MS = "aggregation_interval_ms";
constexpr const char *EN_BUFFER_OVERFLOW_THRESHOLD =
    "buffer_overflow_threshold";
constexpr const char *EN_RETENTION_ENABLED = "retention_enabled";
constexpr const char *EN_RETENTION_SECONDS = "retention_seconds";
constexpr const char *EN_RETENTION_SWEEP_INTERVAL_SECONDS =
    "retention_sweep_interval_seconds";

// Anomaly Settings
constexpr const char *AN_ENABLED = "enabled";
constexpr const char *AN_THRESHOLD = "threshold";
constexpr const char *AN_MIN_SAMPLES = "min_samples";

// Storage Settings
constexpr const char *ST_BACKEND = "backend";
constexpr const char *ST_MAX_RETRIES = "max_retries";
constexpr const char *ST_BASE_DELAY_MS = "base_delay_ms";
constexpr const char *ST_BACKOFF_MULTIPLIER = "backoff_multiplier";
constexpr const char *ST_MAX_DELAY_MS = "max_delay_ms";
constexpr const char *ST_BASELINE_LOOKBACK_DAYS = "baseline_lookback_days";

// Mongo Settings
constexpr const char *MO_URI = "uri";
constexpr const char *MO_DATABASE = "database";
constexpr const char *MO_COLLECTION = "collection";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Prometheus Settings
constexpr const char *PROMETHEUS_ENABLED = "enabled";
constexpr const char *PROMETHEUS_HOST = "host";
constexpr const char *PROMETHEUS_PORT = "port";
constexpr const char *PROMETHEUS_METRICS_PATH = "metrics_path";
constexpr const char *PROMETHEUS_HEALTH_PATH = "health_path";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct EngineConfig {
  std::vector<uint64_t> window_sizes_seconds = {60, 300, 900, 3600};
  uint64_t aggregation_interval_ms = 5000;
  size_t buffer_overflow_threshold = 1000;

  bool retention_enabled = true;
  uint64_t retention_seconds = 604800;             // 7 days
  uint64_t retention_sweep_interval_seconds = 3600; // 1 hour
};

struct AnomalyConfig {
  bool enabled = true;
  double threshold = 3.0;
  uint64_t min_samples = 30;
};

struct StorageConfig {
  std::string backend = "memory";
  size_t max_retries = 3;
  uint64_t base_delay_ms = 100;
  double backoff_multiplier = 2.0;
  uint64_t max_delay_ms = 5000;
  uint32_t baseline_lookback_days = 7;
};

struct MongoStorageConfig {
  std::string uri = "mongodb://localhost:27017";
  std::string database = "metrics";
  std::string collection = "analytics_metrics";
};

struct PrometheusConfig {
  bool enabled = false;
  std::string host = "0.0.0.0";
  int port = 9090;
  std::string metrics_path = "/metrics";
  std::string health_path = "/health";
};

struct AppConfig {
  std::string metrics_input_path; // empty reads from stdin
  bool alerts_to_stdout = true;
  std::string anomaly_output_path = "anomalies.json";
  uint64_t anomaly_cooldown_seconds = 300; // 5 minutes default
  uint32_t ingest_worker_threads = 2;

  EngineConfig engine;
  AnomalyConfig anomaly;
  StorageConfig storage;
  MongoStorageConfig mongo_storage;
  LoggingConfig logging;
  PrometheusConfig prometheus;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_engine_config(const EngineConfig &config,
                            std::vector<std::string> &errors);
bool validate_anomaly_config(const AnomalyConfig &config,
                             std::vector<std::string> &errors);
bool validate_storage_config(const StorageConfig &config,
                             const MongoStorageConfig &mongo_config,
                             std::vector<std::string> &errors);
bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Seeds the per-component levels: everything at WARN, CORE at INFO.
LoggingConfig default_logging_config();

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
