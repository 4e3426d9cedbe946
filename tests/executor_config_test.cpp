// =============================================================================
// executor_config_test.cpp
// =============================================================================
// Unit tests for ExecutorConfig loading and validation.
//
// Validates:
//   - Required keys, defaults for optional keys
//   - "timeout_duration" given in seconds becomes milliseconds
//   - Range checks on every field
//   - Type errors and malformed files surface as ConfigError
// =============================================================================

#include "ordex/config/executor_config.hpp"
#include "ordex/errors/executor_errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

using nlohmann::json;
using ordex::ConfigError;
using ordex::ExecutionStrategy;
using ordex::ExecutorConfig;

// -----------------------------------------------------------------------------
// 1. A minimal document fills every optional field with its default.
// -----------------------------------------------------------------------------
TEST(ExecutorConfigTest, MinimalDocumentUsesDefaults) {
  ExecutorConfig config = ordex::load_executor_config(
      json{{"execution", "fast"}, {"max_spread_pct", 0.002}});

  EXPECT_EQ(config.execution, ExecutionStrategy::Fast);
  EXPECT_DOUBLE_EQ(config.max_spread_pct, 0.002);
  EXPECT_DOUBLE_EQ(config.min_reprice_threshold_pct, 0.0);
  EXPECT_DOUBLE_EQ(config.reprice_override_after_seconds, 0.0);
  EXPECT_EQ(config.timeout_duration, std::chrono::minutes(5));
  EXPECT_DOUBLE_EQ(config.ws_staleness_window_s, 30.0);
  EXPECT_EQ(config.max_ws_reconnect_attempts, 5);
  EXPECT_EQ(config.max_concurrent_orders_per_exchange, 10);
}

// -----------------------------------------------------------------------------
// 2. Every key is read; the timeout is given in seconds.
// -----------------------------------------------------------------------------
TEST(ExecutorConfigTest, FullDocument) {
  ExecutorConfig config = ordex::load_executor_config(json{
      {"execution", "best-price"},
      {"max_spread_pct", 0.01},
      {"min_reprice_threshold_pct", 0.002},
      {"reprice_override_after_seconds", 45.0},
      {"timeout_duration", 1.5},
      {"ws_staleness_window_s", 10.0},
      {"max_ws_reconnect_attempts", 0},
      {"max_concurrent_orders_per_exchange", 3},
  });

  EXPECT_EQ(config.execution, ExecutionStrategy::BestPrice);
  EXPECT_DOUBLE_EQ(config.min_reprice_threshold_pct, 0.002);
  EXPECT_DOUBLE_EQ(config.reprice_override_after_seconds, 45.0);
  EXPECT_EQ(config.timeout_duration, std::chrono::milliseconds(1500));
  EXPECT_DOUBLE_EQ(config.ws_staleness_window_s, 10.0);
  EXPECT_EQ(config.max_ws_reconnect_attempts, 0);
  EXPECT_EQ(config.max_concurrent_orders_per_exchange, 3);
}

// -----------------------------------------------------------------------------
// 3. Missing required keys and unknown strategies are rejected.
// -----------------------------------------------------------------------------
TEST(ExecutorConfigTest, RequiredKeys) {
  EXPECT_THROW(ordex::load_executor_config(json{{"max_spread_pct", 0.01}}),
               ConfigError);
  EXPECT_THROW(ordex::load_executor_config(json{{"execution", "fast"}}),
               ConfigError);
  EXPECT_THROW(ordex::load_executor_config(
                   json{{"execution", "slow"}, {"max_spread_pct", 0.01}}),
               ConfigError);
  EXPECT_THROW(ordex::load_executor_config(json::array()), ConfigError);
}

// -----------------------------------------------------------------------------
// 4. Wrong JSON types become ConfigError, not nlohmann exceptions.
// -----------------------------------------------------------------------------
TEST(ExecutorConfigTest, TypeErrors) {
  EXPECT_THROW(ordex::load_executor_config(
                   json{{"execution", "fast"}, {"max_spread_pct", "wide"}}),
               ConfigError);
  EXPECT_THROW(ordex::load_executor_config(json{{"execution", "fast"},
                                                {"max_spread_pct", 0.01},
                                                {"timeout_duration", "1m"}}),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 5. Range checks.
// -----------------------------------------------------------------------------
TEST(ExecutorConfigTest, RangeChecks) {
  ExecutorConfig config;
  EXPECT_NO_THROW(ordex::validate_executor_config(config));

  config.max_spread_pct = 1.5;
  EXPECT_THROW(ordex::validate_executor_config(config), ConfigError);

  config = ExecutorConfig{};
  config.min_reprice_threshold_pct = -0.1;
  EXPECT_THROW(ordex::validate_executor_config(config), ConfigError);

  config = ExecutorConfig{};
  config.timeout_duration = std::chrono::milliseconds(0);
  EXPECT_THROW(ordex::validate_executor_config(config), ConfigError);

  config = ExecutorConfig{};
  config.ws_staleness_window_s = -1.0;
  EXPECT_THROW(ordex::validate_executor_config(config), ConfigError);

  config = ExecutorConfig{};
  config.max_ws_reconnect_attempts = -1;
  EXPECT_THROW(ordex::validate_executor_config(config), ConfigError);

  config = ExecutorConfig{};
  config.max_concurrent_orders_per_exchange = 0;
  EXPECT_THROW(ordex::validate_executor_config(config), ConfigError);
}

// -----------------------------------------------------------------------------
// 6. Files: a good file loads, a missing or malformed one throws ConfigError.
// -----------------------------------------------------------------------------
TEST(ExecutorConfigTest, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "ordex_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"execution": "fast", "max_spread_pct": 0.003})";
  }
  ExecutorConfig config = ordex::load_executor_config_file(path);
  EXPECT_DOUBLE_EQ(config.max_spread_pct, 0.003);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(ordex::load_executor_config_file(path), ConfigError);
  std::remove(path.c_str());

  EXPECT_THROW(ordex::load_executor_config_file(path + ".missing"),
               ConfigError);
}

// -----------------------------------------------------------------------------
// 7. Strategy names round-trip.
// -----------------------------------------------------------------------------
TEST(ExecutorConfigTest, StrategyNames) {
  EXPECT_STREQ(ordex::to_string(ExecutionStrategy::Fast), "fast");
  EXPECT_STREQ(ordex::to_string(ExecutionStrategy::BestPrice), "best-price");
  EXPECT_EQ(ordex::parse_execution_strategy("best-price"),
            ExecutionStrategy::BestPrice);
}
