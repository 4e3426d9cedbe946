#pragma once

#include "ordex/concurrent/concurrency_limiter.hpp"
#include "ordex/venue/i_venue_client.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>

namespace ordex {

// -----------------------------------------------------------------------------
// ExchangeSession
// -----------------------------------------------------------------------------
//
// @brief  Per-venue, per-batch coordination context shared by every order
//         the router sends to one venue.
//
// @details
// Does not execute orders itself. Provides:
//   - Margin/leverage setup at most once per symbol per batch.
//   - A ConcurrencyLimiter bounding in-flight orders against the venue.
//   - The stream circuit breaker: once a stream executor exhausts its
//     reconnect budget it opens the circuit and every later order of the
//     batch on this venue goes over REST.
//   - Stream pre-warm: initialize() opens the book feed for the first symbol
//     so the first order's subscription connects to a warm socket.
//
// Thread model:
//   All methods are safe from any order task. ensure_margin_initialized()
//   serializes callers on a mutex held across the venue calls, so a second
//   caller for the same symbol waits until setup finished and then returns
//   without calling the venue. The circuit flag is a one-way atomic latch.
//
// Ownership:
//   Created fresh by OrderRouter for each route_and_collect() call. Borrows
//   the venue, which must outlive the session.
// -----------------------------------------------------------------------------
class ExchangeSession {
 public:
  static constexpr std::size_t kDefaultMaxConcurrentOrders = 10;

  explicit ExchangeSession(
      venue::IVenueClient& venue,
      std::size_t max_concurrent_orders = kDefaultMaxConcurrentOrders);

  ExchangeSession(const ExchangeSession&) = delete;
  ExchangeSession& operator=(const ExchangeSession&) = delete;

  // -------------------------------------------------------------------------
  // initialize(symbol)
  // -------------------------------------------------------------------------
  // @brief  Pre-warms the venue's book stream for `symbol`.
  //
  // @details
  // Stream-capable venues only: subscribes, waits up to kPrewarmTimeout for
  // the first snapshot, then closes the subscription. Failures are logged
  // and swallowed; they never fail the batch. The first snapshot is read on
  // a detached thread sharing ownership of the subscription: if close()
  // throws or does not unblock it within kPrewarmCloseTimeout, the reader is
  // abandoned and initialize() returns.
  // -------------------------------------------------------------------------
  void initialize(const std::string& symbol);

  // -------------------------------------------------------------------------
  // ensure_margin_initialized(symbol)
  // -------------------------------------------------------------------------
  // @brief  Calls set_margin_mode("isolated", symbol) and
  //         set_leverage(venue.leverage(), symbol) the first time a symbol is
  //         seen; later calls are no-ops.
  //
  // @details
  // Each setter's failure is logged and swallowed independently (not every
  // venue needs or supports them). The symbol is recorded as initialized
  // even when a setter failed, so a failing venue is not retried per order.
  // -------------------------------------------------------------------------
  void ensure_margin_initialized(const std::string& symbol);

  bool is_margin_initialized(const std::string& symbol) const;

  // One-way: once open, stays open for the session's lifetime.
  void mark_circuit_open();
  bool is_circuit_open() const;

  ConcurrencyLimiter& limiter() { return limiter_; }

  venue::IVenueClient& venue() { return venue_; }

  static constexpr std::chrono::seconds kPrewarmTimeout{5};
  // Wait for the pre-warm reader after close().
  static constexpr std::chrono::seconds kPrewarmCloseTimeout{1};

 private:
  venue::IVenueClient& venue_;
  ConcurrencyLimiter limiter_;
  std::atomic<bool> circuit_open_{false};

  mutable std::mutex margin_mutex_;  // Held across margin/leverage calls
  std::set<std::string> margin_initialized_;
};

}  // namespace ordex
