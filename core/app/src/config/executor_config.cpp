#include "ordex/config/executor_config.hpp"

#include "ordex/errors/executor_errors.hpp"
#include "ordex/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace ordex {

const char* to_string(ExecutionStrategy strategy) {
  switch (strategy) {
    case ExecutionStrategy::Fast:      return "fast";
    case ExecutionStrategy::BestPrice: return "best-price";
  }
  return "unknown";
}

ExecutionStrategy parse_execution_strategy(const std::string& text) {
  if (text == "fast") {
    return ExecutionStrategy::Fast;
  }
  if (text == "best-price") {
    return ExecutionStrategy::BestPrice;
  }
  throw ConfigError("unknown execution strategy '" + text + "'");
}

// -----------------------------------------------------------------------------
// validate_executor_config()
// -----------------------------------------------------------------------------
void validate_executor_config(const ExecutorConfig& config) {
  if (config.max_spread_pct < 0.0 || config.max_spread_pct > 1.0) {
    throw ConfigError("max_spread_pct must be within [0, 1], got " +
                      std::to_string(config.max_spread_pct));
  }
  if (config.min_reprice_threshold_pct < 0.0) {
    throw ConfigError("min_reprice_threshold_pct must be >= 0");
  }
  if (config.reprice_override_after_seconds < 0.0) {
    throw ConfigError("reprice_override_after_seconds must be >= 0");
  }
  if (config.timeout_duration.count() <= 0) {
    throw ConfigError("timeout_duration must be positive");
  }
  if (config.ws_staleness_window_s < 0.0) {
    throw ConfigError("ws_staleness_window_s must be >= 0");
  }
  if (config.max_ws_reconnect_attempts < 0) {
    throw ConfigError("max_ws_reconnect_attempts must be >= 0");
  }
  if (config.max_concurrent_orders_per_exchange < 1) {
    throw ConfigError("max_concurrent_orders_per_exchange must be >= 1");
  }
}

// -----------------------------------------------------------------------------
// load_executor_config(): JSON object -> ExecutorConfig
// -----------------------------------------------------------------------------
ExecutorConfig load_executor_config(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("expected a JSON object");
  }
  if (!document.contains("execution")) {
    throw ConfigError("missing required key 'execution'");
  }
  if (!document.contains("max_spread_pct")) {
    throw ConfigError("missing required key 'max_spread_pct'");
  }

  ExecutorConfig config;
  try {
    config.execution =
        parse_execution_strategy(document.at("execution").get<std::string>());
    config.max_spread_pct = document.at("max_spread_pct").get<double>();
    config.min_reprice_threshold_pct = document.value(
        "min_reprice_threshold_pct", config.min_reprice_threshold_pct);
    config.reprice_override_after_seconds = document.value(
        "reprice_override_after_seconds",
        config.reprice_override_after_seconds);
    if (document.contains("timeout_duration")) {
      config.timeout_duration =
          seconds_to_ms(document.at("timeout_duration").get<double>());
    }
    config.ws_staleness_window_s =
        document.value("ws_staleness_window_s", config.ws_staleness_window_s);
    config.max_ws_reconnect_attempts = document.value(
        "max_ws_reconnect_attempts", config.max_ws_reconnect_attempts);
    config.max_concurrent_orders_per_exchange =
        document.value("max_concurrent_orders_per_exchange",
                       config.max_concurrent_orders_per_exchange);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(e.what());
  }

  validate_executor_config(config);
  return config;
}

// -----------------------------------------------------------------------------
// load_executor_config_file(): read + parse + validate
// -----------------------------------------------------------------------------
ExecutorConfig load_executor_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  return load_executor_config(document);
}

}  // namespace ordex
