#pragma once

#include "ordex/execution/order_executor_base.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ordex {

// -----------------------------------------------------------------------------
// StreamOrderExecutor
// -----------------------------------------------------------------------------
//
// @brief  Places orders over REST and follows them through the venue's push
//         subscriptions.
//
// @details
// Each order runs a single-threaded wait loop over a per-order
// ThreadSafeQueue. Pump threads block in the subscriptions' next() and push
// what they receive:
//
//   book pump    order-book snapshots, for the order's whole life
//   order pump   order-status batches, only while a maker order rests
//
// The loop blocks in pop_for(min(deadline remaining, staleness remaining))
// and handles whichever completes first:
//
//   book snapshot  no resting order: price it (same rules as the REST maker)
//                  and place a limit order. Resting order: ask the reprice
//                  policy, cancel and re-place on approval.
//   status batch   Closed returns the report; Rejected/Canceled drops the
//                  resting order and goes back to price discovery.
//   staleness      no status push for ws_staleness_window_s: one REST
//                  fetch_order (ws_staleness_fallback). Closed returns;
//                  anything else re-arms the timer. Never cancels.
//   deadline       cancel, then execute_taker_fallback("ws_timeout").
//
// A limit-order creation failure classified Fatal fails the pairing and
// raises OrderCreationError; a Transient one is retried on the next book
// snapshot.
//
// The order pump goes through watch_orders_with_backoff(), which retries
// transport errors with exponential backoff and opens the session's circuit
// after max_ws_reconnect_attempts. The resulting CircuitOpenError ends the
// order and names the order already placed, if any: a resting limit order is
// cancelled and its fill read back, a market order is left live. OrderRouter
// continues it over REST.
//
// Thread model:
//   One executor serves many concurrent orders; per-order state (queue,
//   pumps, resting order id) lives on the calling task's stack. On every
//   exit the subscriptions are closed and the pumps joined before any
//   resting order is cancelled. A pump sitting in a reconnect backoff sleep
//   delays that join by up to one backoff step.
// -----------------------------------------------------------------------------
class StreamOrderExecutor final : public OrderExecutorBase {
 public:
  static constexpr std::chrono::milliseconds kBaseReconnectDelay{100};
  static constexpr std::chrono::milliseconds kMaxReconnectDelay{30000};

  StreamOrderExecutor(const ExecutorConfig& config, ITimeProvider& time,
                      OrderEventBus* bus = nullptr);

  // @throws StreamNotSupportedError if the venue has no push support.
  std::optional<domain::ExecutionReport> execute_maker_order(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      ExchangeSession* session) override;

  // Market order followed by status pushes. Rejected/Canceled raises
  // OrderCreationError, the deadline raises OrderTimeoutError.
  std::optional<domain::ExecutionReport> execute_taker_order(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      ExchangeSession* session) override;

  // -------------------------------------------------------------------------
  // watch_orders_with_backoff(subscription, ctx, session)
  // -------------------------------------------------------------------------
  // @brief  Pulls the next order-status batch, riding out transport errors.
  //
  // @details
  // If the session circuit is already open, raises CircuitOpenError without
  // touching the subscription. Each venue::NetworkError counts one attempt
  // and emits ws_reconnect_attempt (attempt number in latency_ms). When
  // max_ws_reconnect_attempts > 0 and the count reaches it, the circuit is
  // opened, ws_circuit_open (Failed) is emitted and CircuitOpenError is
  // raised immediately. Otherwise it sleeps reconnect_delay(attempt) through
  // the time provider and retries.
  //
  // @return The batch, or std::nullopt once the subscription was closed.
  // -------------------------------------------------------------------------
  std::optional<std::vector<domain::VenueOrder>> watch_orders_with_backoff(
      venue::IOrderSubscription& subscription, const OrderContext& ctx,
      ExchangeSession* session) const;

  // 100 ms * 2^(attempt - 1), capped at kMaxReconnectDelay.
  static std::chrono::milliseconds reconnect_delay(int attempt);

 private:
  enum class OrderProgress { Working, Filled, Failed };

  void ensure_stream_support(const venue::IVenueClient& venue) const;

  // Emits the lifecycle event for one status snapshot of the tracked order
  // and reports where it stands. `report` is filled in every case.
  OrderProgress track_status(const domain::VenueOrder& snapshot,
                             const OrderContext& ctx,
                             domain::ExecutionReport& report) const;

  // REST look at an order whose status stream went quiet. Emits
  // ws_staleness_fallback; std::nullopt if the fetch itself failed.
  std::optional<domain::VenueOrder> fetch_stale_order(
      venue::IVenueClient& venue, const OrderContext& ctx) const;

  // Zero disables the staleness timer.
  std::chrono::milliseconds staleness_window() const;
};

}  // namespace ordex
