#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"engine.ingest", LogComponent::ENGINE_INGEST},
    {"engine.window", LogComponent::ENGINE_WINDOW},
    {"engine.anomaly", LogComponent::ENGINE_ANOMALY},
    {"engine.aggregate", LogComponent::ENGINE_AGGREGATE},
    {"engine.baseline", LogComponent::ENGINE_BASELINE},
    {"engine.scheduler", LogComponent::ENGINE_SCHEDULER},
    {"storage", LogComponent::STORAGE},
    {"storage.mongo", LogComponent::STORAGE_MONGO},
    {"io.reader", LogComponent::IO_READER},
    {"io.dispatch", LogComponent::IO_DISPATCH},
    {"metrics.export", LogComponent::METRICS_EXPORT}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

LoggingConfig default_logging_config() {
  LoggingConfig logging;
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
  return logging;
}

bool validate_engine_config(const EngineConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.window_sizes_seconds.empty()) {
    errors.push_back("Engine window sizes cannot be empty");
    valid = false;
  }

  std::set<uint64_t> seen_windows;
  for (uint64_t window : config.window_sizes_seconds) {
    if (window == 0) {
      errors.push_back("Engine window sizes must be greater than 0 seconds");
      valid = false;
    } else if (!seen_windows.insert(window).second) {
      errors.push_back("Engine window size " + std::to_string(window) +
                       " is listed more than once");
      valid = false;
    }
  }

  if (config.aggregation_interval_ms < 10 ||
      config.aggregation_interval_ms > 3600000) {
    errors.push_back(
        "Engine aggregation interval must be between 10 and 3600000 ms");
    valid = false;
  }

  if (config.buffer_overflow_threshold < 1) {
    errors.push_back("Engine buffer overflow threshold must be at least 1");
    valid = false;
  }

  if (config.retention_enabled) {
    if (config.retention_seconds < 60) {
      errors.push_back("Engine retention must be at least 60 seconds");
      valid = false;
    }
    if (config.retention_sweep_interval_seconds < 1 ||
        config.retention_sweep_interval_seconds > 86400) {
      errors.push_back("Engine retention sweep interval must be between 1 "
                       "and 86400 seconds");
      valid = false;
    }
  }

  return valid;
}

bool validate_anomaly_config(const AnomalyConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (!std::isfinite(config.threshold) || config.threshold <= 0.0) {
    errors.push_back("Anomaly threshold must be a positive number");
    valid = false;
  }

  if (config.min_samples < 1) {
    errors.push_back("Anomaly minimum samples must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_storage_config(const StorageConfig &config,
                             const MongoStorageConfig &mongo_config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.backend != "memory" && config.backend != "mongodb") {
    errors.push_back("Storage backend must be 'memory' or 'mongodb', got '" +
                     config.backend + "'");
    valid = false;
  }

  if (config.max_retries > 10) {
    errors.push_back("Storage max retries must be between 0 and 10");
    valid = false;
  }

  if (config.backoff_multiplier < 1.0 || config.backoff_multiplier > 10.0) {
    errors.push_back(
        "Storage backoff multiplier must be between 1.0 and 10.0");
    valid = false;
  }

  if (config.max_delay_ms < config.base_delay_ms) {
    errors.push_back("Storage max delay must not be below the base delay");
    valid = false;
  }

  if (config.baseline_lookback_days < 1 ||
      config.baseline_lookback_days > 365) {
    errors.push_back(
        "Storage baseline lookback must be between 1 and 365 days");
    valid = false;
  }

  if (config.backend == "mongodb") {
    if (mongo_config.uri.empty()) {
      errors.push_back("MongoStorage uri cannot be empty");
      valid = false;
    }
    if (mongo_config.database.empty() || mongo_config.collection.empty()) {
      errors.push_back("MongoStorage database and collection are required");
      valid = false;
    }
  }

  return valid;
}

bool validate_prometheus_config(const PrometheusConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.port < 0 || config.port > 65535) {
    errors.push_back("Prometheus port must be between 0 and 65535");
    valid = false;
  }

  if (config.metrics_path.empty() || config.metrics_path[0] != '/') {
    errors.push_back("Prometheus metrics path must start with '/'");
    valid = false;
  }

  if (config.health_path.empty() || config.health_path[0] != '/') {
    errors.push_back("Prometheus health path must start with '/'");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  valid &= validate_engine_config(config.engine, errors);
  valid &= validate_anomaly_config(config.anomaly, errors);
  valid &= validate_storage_config(config.storage, config.mongo_storage, errors);
  valid &= validate_prometheus_config(config.prometheus, errors);

  if (config.ingest_worker_threads < 1 || config.ingest_worker_threads > 64) {
    errors.push_back("Ingest worker threads must be between 1 and 64");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  config.logging = default_logging_config();

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::METRICS_INPUT_PATH)
          config.metrics_input_path = value;
        else if (key == Keys::ALERTS_TO_STDOUT)
          config.alerts_to_stdout = string_to_bool(value);
        else if (key == Keys::ANOMALY_OUTPUT_PATH)
          config.anomaly_output_path = value;
        else if (key == Keys::ANOMALY_COOLDOWN_SECONDS)
          config.anomaly_cooldown_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.anomaly_cooldown_seconds);
        else if (key == Keys::INGEST_WORKER_THREADS)
          config.ingest_worker_threads =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.ingest_worker_threads);
        else
          config.custom_settings[key] = value;

      } else if (current_section == "Engine") {
        if (key == Keys::EN_WINDOW_SIZES_SECONDS) {
          std::vector<uint64_t> windows;
          for (const auto &window_str : Utils::split_string(value, ',')) {
            auto window_opt =
                Utils::string_to_number<uint64_t>(Utils::trim_copy(window_str));
            if (!window_opt)
              throw std::invalid_argument("window size '" + window_str +
                                          "' is not a number");
            windows.push_back(*window_opt);
          }
          config.engine.window_sizes_seconds = windows;
        } else if (key == Keys::EN_AGGREGATION_INTERVAL_MS)
          config.engine.aggregation_interval_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.engine.aggregation_interval_ms);
        else if (key == Keys::EN_BUFFER_OVERFLOW_THRESHOLD)
          config.engine.buffer_overflow_threshold =
              Utils::string_to_number<size_t>(value).value_or(
                  config.engine.buffer_overflow_threshold);
        else if (key == Keys::EN_RETENTION_ENABLED)
          config.engine.retention_enabled = string_to_bool(value);
        else if (key == Keys::EN_RETENTION_SECONDS)
          config.engine.retention_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.engine.retention_seconds);
        else if (key == Keys::EN_RETENTION_SWEEP_INTERVAL_SECONDS)
          config.engine.retention_sweep_interval_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.engine.retention_sweep_interval_seconds);

      } else if (current_section == "Anomaly") {
        if (key == Keys::AN_ENABLED)
          config.anomaly.enabled = string_to_bool(value);
        else if (key == Keys::AN_THRESHOLD)
          config.anomaly.threshold =
              Utils::string_to_number<double>(value).value_or(
                  config.anomaly.threshold);
        else if (key == Keys::AN_MIN_SAMPLES)
          config.anomaly.min_samples =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.anomaly.min_samples);

      } else if (current_section == "Storage") {
        if (key == Keys::ST_BACKEND) {
          std::string backend = value;
          std::transform(backend.begin(), backend.end(), backend.begin(),
                         ::tolower);
          config.storage.backend = backend;
        } else if (key == Keys::ST_MAX_RETRIES)
          config.storage.max_retries =
              Utils::string_to_number<size_t>(value).value_or(
                  config.storage.max_retries);
        else if (key == Keys::ST_BASE_DELAY_MS)
          config.storage.base_delay_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.storage.base_delay_ms);
        else if (key == Keys::ST_BACKOFF_MULTIPLIER)
          config.storage.backoff_multiplier =
              Utils::string_to_number<double>(value).value_or(
                  config.storage.backoff_multiplier);
        else if (key == Keys::ST_MAX_DELAY_MS)
          config.storage.max_delay_ms =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.storage.max_delay_ms);
        else if (key == Keys::ST_BASELINE_LOOKBACK_DAYS)
          config.storage.baseline_lookback_days =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.storage.baseline_lookback_days);

      } else if (current_section == "MongoStorage") {
        if (key == Keys::MO_URI)
          config.mongo_storage.uri = value;
        else if (key == Keys::MO_DATABASE)
          config.mongo_storage.database = value;
        else if (key == Keys::MO_COLLECTION)
          config.mongo_storage.collection = value;

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "engine.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map)
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
          }
        }

      } else if (current_section == "Prometheus") {
        if (key == Keys::PROMETHEUS_ENABLED)
          config.prometheus.enabled = string_to_bool(value);
        else if (key == Keys::PROMETHEUS_HOST)
          config.prometheus.host = value;
        else if (key == Keys::PROMETHEUS_PORT)
          config.prometheus.port = Utils::string_to_number<int>(value).value_or(
              config.prometheus.port);
        else if (key == Keys::PROMETHEUS_METRICS_PATH)
          config.prometheus.metrics_path = value;
        else if (key == Keys::PROMETHEUS_HEALTH_PATH)
          config.prometheus.health_path = value;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
