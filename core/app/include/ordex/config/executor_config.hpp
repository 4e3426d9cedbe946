#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <string>

namespace ordex {

// -----------------------------------------------------------------------------
// ExecutionStrategy
// -----------------------------------------------------------------------------
//   Fast       rest at the top of the book from the first second
//   BestPrice  start deeper in the book and walk toward the top as the order
//              ages (look-back index 5 -> 0 over three minutes)
// Wire values: "fast", "best-price".
// -----------------------------------------------------------------------------
enum class ExecutionStrategy {
  Fast,
  BestPrice,
};

const char* to_string(ExecutionStrategy strategy);

// Throws ConfigError on anything but "fast" / "best-price".
ExecutionStrategy parse_execution_strategy(const std::string& text);

// -----------------------------------------------------------------------------
// ExecutorConfig
// -----------------------------------------------------------------------------
// Responsibility: Tunables shared by the router, sessions and every executor
// of one batch.
//
// Thread model: Plain struct, copied into each component at construction and
// never mutated afterwards.
// -----------------------------------------------------------------------------
struct ExecutorConfig {
  ExecutionStrategy execution{ExecutionStrategy::Fast};

  // Widest (ask - bid) / bid a maker will quote into. Range [0, 1].
  double max_spread_pct{0.0};

  // Minimum relative price move before a resting maker order is repriced.
  // 0 disables the threshold.
  double min_reprice_threshold_pct{0.0};

  // Order age after which any price move triggers a reprice regardless of
  // min_reprice_threshold_pct. 0 disables the override.
  double reprice_override_after_seconds{0.0};

  // Per-order deadline. Makers fall back to a taker order once it passes.
  std::chrono::milliseconds timeout_duration{std::chrono::minutes(5)};

  // A resting stream order with no status push for this long is re-checked
  // over REST.
  double ws_staleness_window_s{30.0};

  // Stream reconnects before the venue's circuit opens. 0 means unlimited.
  int max_ws_reconnect_attempts{5};

  // Orders in flight per venue.
  int max_concurrent_orders_per_exchange{10};
};

// -------------------------------------------------------------------------
// validate_executor_config
// -------------------------------------------------------------------------
// @brief  Throws ConfigError if any field is out of range.
// -------------------------------------------------------------------------
void validate_executor_config(const ExecutorConfig& config);

// -------------------------------------------------------------------------
// load_executor_config / load_executor_config_file
// -------------------------------------------------------------------------
// @brief  Parse a flat JSON object into a validated ExecutorConfig.
//
// @details
// Keys match the struct field names. "execution" and "max_spread_pct" are
// required; every other key falls back to the struct default.
// "timeout_duration" is given in (fractional) seconds. Missing required keys,
// wrong JSON types, range violations, an unreadable file and malformed JSON
// all raise ConfigError.
// -------------------------------------------------------------------------
ExecutorConfig load_executor_config(const nlohmann::json& document);
ExecutorConfig load_executor_config_file(const std::string& path);

}  // namespace ordex
