#pragma once

#include "ordex/config/executor_config.hpp"
#include "ordex/domain/order_book.hpp"
#include "ordex/eventbus/order_event_bus.hpp"
#include "ordex/events/order_event.hpp"
#include "ordex/execution/i_order_executor.hpp"
#include "ordex/execution/reprice_policy.hpp"
#include "ordex/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace ordex {

// -----------------------------------------------------------------------------
// OrderContext
// -----------------------------------------------------------------------------
// Identity of one order execution, threaded through event construction and
// logging. `order_id` is "unknown" until the venue acknowledges an order and
// changes every time a maker is cancelled and re-placed.
// -----------------------------------------------------------------------------
struct OrderContext {
  std::string order_id{"unknown"};
  std::string venue_id;
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  std::int64_t submit_ms{0};
  std::string log_prefix;  // "venue symbol side"
};

// -----------------------------------------------------------------------------
// OrderExecutorBase
// -----------------------------------------------------------------------------
//
// @brief  Behaviour shared by the REST and stream executors.
//
// @details
// Owns the executor-wide collaborators (config, clock, event bus, reprice
// policy) and implements the pieces both state machines need:
//   - request validation and the per-order deadline check
//   - book analysis: look-back index, target price, spread, and the
//     "is the new price worth adopting" rule
//   - event construction/emission and the reprice decision + its event
//   - ExecutionReport construction from venue snapshots
//   - best-effort cancellation of resting orders
//   - following a placed order to a terminal status over REST, with the
//     fetch-failure backoff
//   - the deadline fallback to a REST market order
//
// Thread model: Stateless apart from the injected collaborators, so one
// executor may serve concurrent orders. The event bus and clock must be
// thread-safe (both are).
//
// Ownership: Borrows the clock and the bus; both must outlive the executor.
// Owns its reprice policy.
// -----------------------------------------------------------------------------
class OrderExecutorBase : public IOrderExecutor {
 public:
  ~OrderExecutorBase() override = default;

  OrderExecutorBase(const OrderExecutorBase&) = delete;
  OrderExecutorBase& operator=(const OrderExecutorBase&) = delete;

  static constexpr int kMaxConsecutiveFetchFailures = 4;

  const ExecutorConfig& config() const { return config_; }

  // 200 ms during an order's first 10 s, 1 s afterwards.
  static std::chrono::milliseconds adaptive_poll_interval(
      double elapsed_seconds);

  // Delay after the n-th consecutive fetch failure (n >= 1):
  // 0.5 s, 1 s, 2 s, then 4 s.
  static std::chrono::milliseconds fetch_backoff_delay(int consecutive_failures);

  // -------------------------------------------------------------------------
  // validate_request(request)
  // -------------------------------------------------------------------------
  // @throws OrderValidationError if amount <= 0, the symbol is empty, or a
  //         limit order carries no positive price.
  // -------------------------------------------------------------------------
  void validate_request(const domain::OrderRequest& request) const;

  // -------------------------------------------------------------------------
  // best_price_index(elapsed_seconds)
  // -------------------------------------------------------------------------
  // @brief  How deep into our own side of the book a maker quotes.
  //
  // @details
  // Fast always quotes the top level (0). BestPrice starts five levels deep
  // and walks to the top as the order ages:
  //   < 10 s -> 5, < 30 s -> 4, < 60 s -> 3, < 120 s -> 2, < 180 s -> 1,
  //   otherwise 0.
  // -------------------------------------------------------------------------
  std::size_t best_price_index(double elapsed_seconds) const;

  // -------------------------------------------------------------------------
  // analyze_order_book(book, side, current, elapsed_seconds, log_prefix)
  // -------------------------------------------------------------------------
  // @brief  Derives a new pricing state from a book snapshot, or nullopt if
  //         the current price should be kept.
  //
  // @details
  // Needs both sides of the book. Spread is (best ask - best bid) / best
  // bid. A buy targets bids[min(index, depth - 1)], a sell the same on asks.
  // A new state is returned when there is no current price, when the target
  // is more competitive (higher bid / lower ask), or when the current price
  // crossed the top of the book (buy above best bid, sell below best ask).
  // -------------------------------------------------------------------------
  std::optional<domain::OrderBookState> analyze_order_book(
      const domain::OrderBook& book, domain::Side side,
      const std::optional<domain::OrderBookState>& current,
      double elapsed_seconds, const std::string& log_prefix) const;

  // "venue symbol side" (side omitted when not given).
  static std::string log_prefix(const venue::IVenueClient& venue,
                                const std::string& symbol,
                                std::optional<domain::Side> side = std::nullopt);

 protected:
  OrderExecutorBase(std::string component, const ExecutorConfig& config,
                    ITimeProvider& time, OrderEventBus* bus);

  // Throws OrderTimeoutError once now - start_ms exceeds timeout_duration.
  void check_timeout(std::int64_t start_ms, const std::string& symbol,
                     const std::string& order_type) const;

  OrderContext make_context(const venue::IVenueClient& venue,
                            const domain::OrderRequest& request,
                            std::int64_t submit_ms) const;

  // Latency defaults to now - ctx.submit_ms when not given explicitly.
  OrderEvent make_event(const OrderContext& ctx, OrderState state,
                        const std::string& event_name,
                        std::optional<double> fill_price = std::nullopt,
                        std::optional<double> fill_qty = std::nullopt,
                        std::optional<std::int64_t> latency_ms =
                            std::nullopt) const;

  // No-op without a bus.
  void emit(const OrderEvent& event) const;

  // -------------------------------------------------------------------------
  // check_should_reprice(ctx, old_price, new_price, elapsed_seconds)
  // -------------------------------------------------------------------------
  // @brief  Consults the reprice policy and emits its outcome:
  //           approved   -> order_repriced (UpdatingOrder)
  //           suppressed -> order_reprice_suppressed (MonitoringOrder)
  //         Both carry fill_price = new price, fill_qty = old price.
  // -------------------------------------------------------------------------
  bool check_should_reprice(const OrderContext& ctx, double old_price,
                            double new_price, double elapsed_seconds) const;

  domain::ExecutionReport build_report(const domain::VenueOrder& order,
                                       const OrderContext& ctx) const;

  // -------------------------------------------------------------------------
  // cancel_order(venue, ctx)
  // -------------------------------------------------------------------------
  // @brief  Cancels ctx.order_id.
  // @throws OrderCancellationError wrapping the venue failure.
  // -------------------------------------------------------------------------
  void cancel_order(venue::IVenueClient& venue, const OrderContext& ctx) const;

  // -------------------------------------------------------------------------
  // cancel_pending_orders(venue, symbol, order_id)
  // -------------------------------------------------------------------------
  // @brief  Best-effort cleanup: cancels `order_id` if given, then every
  //         open order the venue reports for `symbol`. Never throws; each
  //         failure is logged and skipped.
  // -------------------------------------------------------------------------
  void cancel_pending_orders(venue::IVenueClient& venue,
                             const std::string& symbol,
                             const std::optional<std::string>& order_id =
                                 std::nullopt) const;

  // -------------------------------------------------------------------------
  // poll_until_closed(venue, ctx, limit)
  // -------------------------------------------------------------------------
  // @brief  Fetches ctx.order_id at the adaptive interval until it is
  //         Closed, and returns its report (order_fill_complete emitted).
  //
  // @details
  // Partial fills emit order_fill_partial. A failed fetch backs off with
  // fetch_backoff_delay(); the counter resets on success.
  //
  // @throws OrderCreationError  the order ended Rejected/Canceled.
  // @throws OrderFetchError     kMaxConsecutiveFetchFailures fetches in a row
  //                             failed.
  // @throws OrderTimeoutError   `limit` passed since ctx.submit_ms.
  // -------------------------------------------------------------------------
  domain::ExecutionReport poll_until_closed(venue::IVenueClient& venue,
                                            const OrderContext& ctx,
                                            std::chrono::milliseconds limit);

  // Backs off after a failed fetch; throws OrderFetchError once the streak
  // reaches kMaxConsecutiveFetchFailures.
  void on_fetch_failure(int consecutive_failures, const OrderContext& ctx,
                        const std::exception& error);

  // -------------------------------------------------------------------------
  // execute_taker_fallback(venue, request, reason)
  // -------------------------------------------------------------------------
  // @brief  Deadline fallback shared by both executors: emits
  //         order_timeout_fallback (TimedOut), places a market order and
  //         returns its report.
  //
  // @details
  // An acknowledgment that is not yet Closed is followed with
  // poll_until_closed() for up to kTakerFallbackFollowLimit, counted from the
  // fallback itself. A failed placement, or an order that cannot be followed
  // to Closed, is logged and yields std::nullopt.
  // -------------------------------------------------------------------------
  static constexpr std::chrono::milliseconds kTakerFallbackFollowLimit{
      std::chrono::seconds(60)};

  std::optional<domain::ExecutionReport> execute_taker_fallback(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      const std::string& reason);

  void log_info(const std::string& message) const;
  void log_warning(const std::string& message) const;
  void log_error(const std::string& message) const;

  const std::string component_;
  const ExecutorConfig config_;
  ITimeProvider& time_;
  OrderEventBus* bus_;
  std::unique_ptr<IRepricePolicy> reprice_policy_;
};

}  // namespace ordex
