#pragma once

#include "ordex/execution/order_executor_base.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace ordex {

// -----------------------------------------------------------------------------
// RestOrderExecutor
// -----------------------------------------------------------------------------
//
// @brief  Places and monitors orders with request/response venue calls only.
//
// @details
// Maker state machine:
//
//   CreateOrder -> MonitoringOrder -> UpdatingOrder -> WaitUntilOrderCancelled
//        ^                |                                     |
//        |                +-- rejected/canceled ----------------+
//        +------------------------------------------------------+
//
//   CreateOrder        price from the latest book; skip the cycle while the
//                      spread exceeds max_spread_pct; place a limit order.
//   MonitoringOrder    fetch the order: Closed returns, Rejected/Canceled
//                      goes back to CreateOrder, a partial fill is reported.
//                      Then re-read the book and ask the reprice policy.
//   UpdatingOrder      cancel the resting order (a failed cancel goes back
//                      to monitoring).
//   WaitUntil...       one poll interval, then CreateOrder.
//
// Every cycle sleeps adaptive_poll_interval(): 200 ms during the order's
// first 10 s, 1 s afterwards. Consecutive fetch_order failures back off
// 0.5 s, 1 s, 2 s, 4 s; the fourth in a row raises OrderFetchError.
// At the deadline the resting order is cancelled and the request is re-run
// as a taker (market) order.
//
// Taker: up to three create attempts, then poll to a terminal status with
// the same failure backoff.
//
// Thread model: Per-order state lives on the stack; one instance can serve
// concurrent orders. All waits go through ITimeProvider::sleep_for.
// -----------------------------------------------------------------------------
class RestOrderExecutor final : public OrderExecutorBase {
 public:
  static constexpr int kTakerCreateMaxAttempts = 3;

  RestOrderExecutor(const ExecutorConfig& config, ITimeProvider& time,
                    OrderEventBus* bus = nullptr);

  std::optional<domain::ExecutionReport> execute_maker_order(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      ExchangeSession* session) override;

  std::optional<domain::ExecutionReport> execute_taker_order(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      ExchangeSession* session) override;

  // -------------------------------------------------------------------------
  // follow_order(venue, request, order_id)
  // -------------------------------------------------------------------------
  // @brief  Takes over an order another executor already placed and polls
  //         it to Closed without placing anything. Used when a stream order
  //         loses its feed after acknowledgment.
  //
  // @details
  // Same polling and failure backoff as the taker path, bounded by
  // timeout_duration from the takeover. A terminal failure emits
  // order_failed and propagates.
  // -------------------------------------------------------------------------
  std::optional<domain::ExecutionReport> follow_order(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      const std::string& order_id);

 private:
  enum class MakerState {
    CreateOrder,
    MonitoringOrder,
    UpdatingOrder,
    WaitUntilOrderCancelled,
  };

  // Runs the maker state machine until Closed (returns) or an error/timeout
  // (throws). `resting_id` tracks the order currently on the book so the
  // caller can cancel it on the way out.
  domain::ExecutionReport run_maker_loop(venue::IVenueClient& venue,
                                         const domain::OrderRequest& request,
                                         OrderContext& ctx,
                                         std::optional<std::string>& resting_id);

  std::optional<domain::OrderBookState> fetch_order_book_update(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      const std::optional<domain::OrderBookState>& current,
      double elapsed_seconds, const OrderContext& ctx) const;
};

}  // namespace ordex
