#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ordex {

// -----------------------------------------------------------------------------
// Executor error hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Exceptions raised by executors, the router and the config loader.
//
// @details
//   OrderExecutorError            base, std::runtime_error
//     OrderValidationError        request rejected before any venue call
//     OrderCreationError          venue refused or never acknowledged an order
//     OrderFetchError             status polling failed too many times in a row
//     OrderCancellationError      cancel of a resting order failed
//     OrderTimeoutError           order exceeded ExecutorConfig::timeout_duration
//     CircuitOpenError            stream reconnects exhausted for a venue
//     StreamNotSupportedError     stream executor used on a REST-only venue
//     ConfigError                 invalid ExecutorConfig input
//
// Each subclass keeps the fields it was built from so callers can branch on
// them without parsing what().
// -----------------------------------------------------------------------------
class OrderExecutorError : public std::runtime_error {
 public:
  explicit OrderExecutorError(const std::string& message)
      : std::runtime_error(message) {}
};

class OrderValidationError : public OrderExecutorError {
 public:
  OrderValidationError(std::string symbol, const std::string& reason)
      : OrderExecutorError("Invalid order for " + symbol + ": " + reason),
        symbol_(std::move(symbol)) {}

  const std::string& symbol() const { return symbol_; }

 private:
  std::string symbol_;
};

class OrderCreationError : public OrderExecutorError {
 public:
  OrderCreationError(std::string symbol, std::string order_type,
                     const std::string& reason)
      : OrderExecutorError("Failed to create " + order_type + " order for " +
                           symbol + ": " + reason),
        symbol_(std::move(symbol)),
        order_type_(std::move(order_type)) {}

  const std::string& symbol() const { return symbol_; }
  const std::string& order_type() const { return order_type_; }

 private:
  std::string symbol_;
  std::string order_type_;
};

class OrderFetchError : public OrderExecutorError {
 public:
  OrderFetchError(std::string symbol, std::string order_id,
                  const std::string& reason)
      : OrderExecutorError("Failed to fetch order " + order_id + " for " +
                           symbol + ": " + reason),
        symbol_(std::move(symbol)),
        order_id_(std::move(order_id)) {}

  const std::string& symbol() const { return symbol_; }
  const std::string& order_id() const { return order_id_; }

 private:
  std::string symbol_;
  std::string order_id_;
};

class OrderCancellationError : public OrderExecutorError {
 public:
  OrderCancellationError(std::string symbol, std::string order_id,
                         const std::string& reason)
      : OrderExecutorError("Failed to cancel order " + order_id + " for " +
                           symbol + ": " + reason),
        symbol_(std::move(symbol)),
        order_id_(std::move(order_id)) {}

  const std::string& symbol() const { return symbol_; }
  const std::string& order_id() const { return order_id_; }

 private:
  std::string symbol_;
  std::string order_id_;
};

class OrderTimeoutError : public OrderExecutorError {
 public:
  OrderTimeoutError(std::string symbol, std::string order_type,
                    double timeout_seconds)
      : OrderExecutorError(order_type + " order for " + symbol +
                           " timed out after " +
                           std::to_string(timeout_seconds) + "s"),
        symbol_(std::move(symbol)),
        order_type_(std::move(order_type)),
        timeout_seconds_(timeout_seconds) {}

  const std::string& symbol() const { return symbol_; }
  const std::string& order_type() const { return order_type_; }
  double timeout_seconds() const { return timeout_seconds_; }

 private:
  std::string symbol_;
  std::string order_type_;
  double timeout_seconds_;
};

// Raised by the stream executor. When the circuit opened after an order was
// acknowledged, `placed_order_id` names it and `filled` is the quantity the
// venue reported filled at the time the stream gave up (nullopt if that
// could not be read). Whoever continues the order must not place the filled
// part again.
class CircuitOpenError : public OrderExecutorError {
 public:
  CircuitOpenError(std::string venue_id, int attempts)
      : OrderExecutorError("Stream circuit breaker opened for " + venue_id +
                           " after " + std::to_string(attempts) +
                           " consecutive failures"),
        venue_id_(std::move(venue_id)),
        attempts_(attempts) {}

  CircuitOpenError(const CircuitOpenError& cause, std::string placed_order_id,
                   std::optional<double> filled)
      : OrderExecutorError(std::string(cause.what()) + " (order " +
                           placed_order_id + " already placed)"),
        venue_id_(cause.venue_id_),
        attempts_(cause.attempts_),
        placed_order_id_(std::move(placed_order_id)),
        filled_(filled) {}

  const std::string& venue_id() const { return venue_id_; }
  int attempts() const { return attempts_; }
  const std::optional<std::string>& placed_order_id() const {
    return placed_order_id_;
  }
  std::optional<double> filled() const { return filled_; }

 private:
  std::string venue_id_;
  int attempts_;
  std::optional<std::string> placed_order_id_;
  std::optional<double> filled_;
};

class StreamNotSupportedError : public OrderExecutorError {
 public:
  explicit StreamNotSupportedError(std::string venue_id)
      : OrderExecutorError("Venue " + venue_id +
                           " does not support order streaming"),
        venue_id_(std::move(venue_id)) {}

  const std::string& venue_id() const { return venue_id_; }

 private:
  std::string venue_id_;
};

class ConfigError : public OrderExecutorError {
 public:
  explicit ConfigError(const std::string& message)
      : OrderExecutorError("Invalid executor config: " + message) {}
};

}  // namespace ordex
