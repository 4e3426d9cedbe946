#include "ordex/execution/order_executor_base.hpp"

#include "ordex/errors/executor_errors.hpp"
#include "ordex/time/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace ordex {

namespace {

constexpr std::chrono::milliseconds kFastPollInterval{200};
constexpr std::chrono::milliseconds kSlowPollInterval{1000};
constexpr double kFastPollWindowSeconds = 10.0;

constexpr std::array<std::chrono::milliseconds, 4> kFetchBackoffDelays = {
    std::chrono::milliseconds{500}, std::chrono::milliseconds{1000},
    std::chrono::milliseconds{2000}, std::chrono::milliseconds{4000}};

}  // namespace

OrderExecutorBase::OrderExecutorBase(std::string component,
                                     const ExecutorConfig& config,
                                     ITimeProvider& time, OrderEventBus* bus)
    : component_(std::move(component)),
      config_(config),
      time_(time),
      bus_(bus),
      reprice_policy_(build_reprice_policy(config)) {}

std::chrono::milliseconds OrderExecutorBase::adaptive_poll_interval(
    double elapsed_seconds) {
  return elapsed_seconds < kFastPollWindowSeconds ? kFastPollInterval
                                                  : kSlowPollInterval;
}

std::chrono::milliseconds OrderExecutorBase::fetch_backoff_delay(
    int consecutive_failures) {
  if (consecutive_failures < 1) {
    return kFetchBackoffDelays.front();
  }
  const auto index = std::min<std::size_t>(
      static_cast<std::size_t>(consecutive_failures - 1),
      kFetchBackoffDelays.size() - 1);
  return kFetchBackoffDelays[index];
}

// -----------------------------------------------------------------------------
// validate_request()
// -----------------------------------------------------------------------------
void OrderExecutorBase::validate_request(
    const domain::OrderRequest& request) const {
  if (request.symbol.empty()) {
    throw OrderValidationError(request.symbol, "symbol is empty");
  }
  if (!(request.amount > 0.0)) {
    throw OrderValidationError(
        request.symbol, "invalid order amount: " + std::to_string(request.amount));
  }
  if (request.kind == domain::OrderKind::Limit &&
      !(request.price.has_value() && *request.price > 0.0)) {
    throw OrderValidationError(
        request.symbol,
        "invalid limit price: " +
            (request.price.has_value() ? std::to_string(*request.price)
                                       : std::string("none")));
  }
}

// -----------------------------------------------------------------------------
// check_timeout()
// -----------------------------------------------------------------------------
void OrderExecutorBase::check_timeout(std::int64_t start_ms,
                                      const std::string& symbol,
                                      const std::string& order_type) const {
  if (time_.now_ms() - start_ms > config_.timeout_duration.count()) {
    throw OrderTimeoutError(
        symbol, order_type,
        static_cast<double>(config_.timeout_duration.count()) / 1000.0);
  }
}

// -----------------------------------------------------------------------------
// best_price_index(): look-back depth by strategy and order age
// -----------------------------------------------------------------------------
std::size_t OrderExecutorBase::best_price_index(double elapsed_seconds) const {
  if (config_.execution == ExecutionStrategy::Fast) {
    return 0;
  }
  if (elapsed_seconds < 10.0) return 5;
  if (elapsed_seconds < 30.0) return 4;
  if (elapsed_seconds < 60.0) return 3;
  if (elapsed_seconds < 120.0) return 2;
  if (elapsed_seconds < 180.0) return 1;
  return 0;
}

// -----------------------------------------------------------------------------
// analyze_order_book(): book snapshot -> pricing decision
// -----------------------------------------------------------------------------
std::optional<domain::OrderBookState> OrderExecutorBase::analyze_order_book(
    const domain::OrderBook& book, domain::Side side,
    const std::optional<domain::OrderBookState>& current,
    double elapsed_seconds, const std::string& log_prefix) const {
  if (book.bids.empty() || book.asks.empty()) {
    return std::nullopt;
  }

  const double best_bid = book.bids.front().price;
  const double best_ask = book.asks.front().price;
  if (!(best_bid > 0.0)) {
    log_warning(log_prefix + " - book has a non-positive best bid");
    return std::nullopt;
  }
  const double spread_pct = (best_ask - best_bid) / best_bid;

  const std::size_t index = best_price_index(elapsed_seconds);
  const std::optional<double> current_price =
      current.has_value() ? std::optional<double>(current->best_price)
                          : std::nullopt;

  double target = 0.0;
  bool should_update = false;
  if (side == domain::Side::Buy) {
    const std::size_t safe_index = std::min(index, book.bids.size() - 1);
    target = book.bids[safe_index].price;
    should_update = !current_price.has_value() ||  // no price yet
                    target > *current_price ||     // more competitive
                    *current_price > best_bid;     // crossed the top
  } else {
    const std::size_t safe_index = std::min(index, book.asks.size() - 1);
    target = book.asks[safe_index].price;
    should_update = !current_price.has_value() ||
                    target < *current_price ||
                    *current_price < best_ask;
  }

  if (!should_update) {
    return std::nullopt;
  }
  return domain::OrderBookState{target, spread_pct};
}

std::string OrderExecutorBase::log_prefix(const venue::IVenueClient& venue,
                                          const std::string& symbol,
                                          std::optional<domain::Side> side) {
  std::string prefix = venue.id() + " " + symbol;
  if (side.has_value()) {
    prefix += " ";
    prefix += domain::to_string(*side);
  }
  return prefix;
}

OrderContext OrderExecutorBase::make_context(
    const venue::IVenueClient& venue, const domain::OrderRequest& request,
    std::int64_t submit_ms) const {
  OrderContext ctx;
  ctx.venue_id = venue.id();
  ctx.symbol = request.symbol;
  ctx.side = request.side;
  ctx.submit_ms = submit_ms;
  ctx.log_prefix = log_prefix(venue, request.symbol, request.side);
  return ctx;
}

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------
OrderEvent OrderExecutorBase::make_event(
    const OrderContext& ctx, OrderState state, const std::string& event_name,
    std::optional<double> fill_price, std::optional<double> fill_qty,
    std::optional<std::int64_t> latency_ms) const {
  const std::int64_t now = time_.now_ms();

  OrderEvent event;
  event.order_id = ctx.order_id;
  event.venue_id = ctx.venue_id;
  event.symbol = ctx.symbol;
  event.side = ctx.side;
  event.state = state;
  event.timestamp_ms = now;
  event.event_name = event_name;
  event.latency_ms = latency_ms.has_value()
                         ? *latency_ms
                         : std::max<std::int64_t>(0, now - ctx.submit_ms);
  event.fill_price = fill_price;
  event.fill_qty = fill_qty;
  return event;
}

void OrderExecutorBase::emit(const OrderEvent& event) const {
  if (bus_ != nullptr) {
    bus_->emit(event);
  }
}

bool OrderExecutorBase::check_should_reprice(const OrderContext& ctx,
                                             double old_price,
                                             double new_price,
                                             double elapsed_seconds) const {
  const bool proceed =
      reprice_policy_->should_reprice(old_price, new_price, elapsed_seconds);

  if (proceed) {
    emit(make_event(ctx, OrderState::UpdatingOrder, "order_repriced",
                    new_price, old_price));
  } else {
    const double change_pct =
        old_price > 0.0 ? std::fabs(new_price - old_price) / old_price : 0.0;
    log_info(ctx.log_prefix + " - reprice suppressed: change_pct=" +
             std::to_string(change_pct) + " threshold_pct=" +
             std::to_string(config_.min_reprice_threshold_pct));
    emit(make_event(ctx, OrderState::MonitoringOrder,
                    "order_reprice_suppressed", new_price, old_price));
  }
  return proceed;
}

domain::ExecutionReport OrderExecutorBase::build_report(
    const domain::VenueOrder& order, const OrderContext& ctx) const {
  return domain::make_execution_report(order, ctx.venue_id, ctx.submit_ms,
                                       time_.now_ms());
}

// -----------------------------------------------------------------------------
// Cancellation
// -----------------------------------------------------------------------------
void OrderExecutorBase::cancel_order(venue::IVenueClient& venue,
                                     const OrderContext& ctx) const {
  try {
    venue.cancel_order(ctx.order_id, ctx.symbol);
  } catch (const std::exception& e) {
    throw OrderCancellationError(ctx.symbol, ctx.order_id, e.what());
  }
}

void OrderExecutorBase::cancel_pending_orders(
    venue::IVenueClient& venue, const std::string& symbol,
    const std::optional<std::string>& order_id) const {
  const std::string prefix = log_prefix(venue, symbol);

  if (order_id.has_value() && !order_id->empty()) {
    try {
      venue.cancel_order(*order_id, symbol);
    } catch (const std::exception& e) {
      log_warning(prefix + " - failed to cancel order " + *order_id + ": " +
                  e.what());
    }
  }

  std::vector<domain::VenueOrder> open_orders;
  try {
    open_orders = venue.fetch_open_orders(symbol);
  } catch (const std::exception& e) {
    log_warning(prefix + " - failed to fetch open orders: " + e.what());
    return;
  }

  for (const auto& open_order : open_orders) {
    try {
      venue.cancel_order(open_order.id, symbol);
      log_info(prefix + " - cancelled stale order " + open_order.id);
    } catch (const std::exception& e) {
      log_warning(prefix + " - failed to cancel order " + open_order.id +
                  ": " + e.what());
    }
  }
}

// -----------------------------------------------------------------------------
// poll_until_closed(): follow a placed order to a terminal status
// -----------------------------------------------------------------------------
void OrderExecutorBase::on_fetch_failure(int consecutive_failures,
                                         const OrderContext& ctx,
                                         const std::exception& error) {
  log_warning(ctx.log_prefix + " - failed to fetch order status (attempt " +
              std::to_string(consecutive_failures) + "): " + error.what());
  time_.sleep_for(fetch_backoff_delay(consecutive_failures));
  if (consecutive_failures >= kMaxConsecutiveFetchFailures) {
    throw OrderFetchError(ctx.symbol, ctx.order_id,
                          "failed " + std::to_string(consecutive_failures) +
                              " consecutive times: " + error.what());
  }
}

domain::ExecutionReport OrderExecutorBase::poll_until_closed(
    venue::IVenueClient& venue, const OrderContext& ctx,
    std::chrono::milliseconds limit) {
  int fetch_failures = 0;

  while (true) {
    if (time_.now_ms() - ctx.submit_ms > limit.count()) {
      throw OrderTimeoutError(ctx.symbol, "taker-poll",
                              static_cast<double>(limit.count()) / 1000.0);
    }
    const double elapsed = elapsed_seconds(ctx.submit_ms, time_.now_ms());

    domain::VenueOrder snapshot;
    try {
      snapshot = venue.fetch_order(ctx.order_id, ctx.symbol);
      fetch_failures = 0;
    } catch (const std::exception& e) {
      ++fetch_failures;
      on_fetch_failure(fetch_failures, ctx, e);
      continue;
    }

    domain::ExecutionReport report = build_report(snapshot, ctx);
    if (report.status == domain::OrderStatus::Closed) {
      log_info(ctx.log_prefix + " - taker order filled");
      emit(make_event(ctx, OrderState::Filled, "order_fill_complete",
                      report.average_price, report.filled));
      return report;
    }
    if (domain::is_failed_terminal(report.status)) {
      throw OrderCreationError(
          ctx.symbol, "market",
          std::string("order was ") + domain::to_string(report.status));
    }
    if (report.filled > 0.0) {
      emit(make_event(ctx, OrderState::PartiallyFilled, "order_fill_partial",
                      report.average_price, report.filled));
    }

    time_.sleep_for(adaptive_poll_interval(elapsed));
  }
}

// -----------------------------------------------------------------------------
// execute_taker_fallback(): deadline fallback to a market order
// -----------------------------------------------------------------------------
std::optional<domain::ExecutionReport> OrderExecutorBase::execute_taker_fallback(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    const std::string& reason) {
  OrderContext ctx = make_context(venue, request, time_.now_ms());
  emit(make_event(ctx, OrderState::TimedOut, "order_timeout_fallback"));
  log_info(ctx.log_prefix + " - timeout fallback to taker (reason=" + reason +
           ")");

  domain::VenueOrder order;
  try {
    order = venue.create_market_order(request.symbol, request.side,
                                      request.amount, request.params);
  } catch (const std::exception& e) {
    log_error(ctx.log_prefix + " - taker fallback failed: " + e.what());
    return std::nullopt;
  }

  ctx.order_id = order.id;
  if (order.status == domain::OrderStatus::Closed) {
    return build_report(order, ctx);
  }

  try {
    return poll_until_closed(venue, ctx, kTakerFallbackFollowLimit);
  } catch (const std::exception& e) {
    log_error(ctx.log_prefix + " - taker fallback order " + order.id +
              " not closed: " + e.what());
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// Logging: one write per line so concurrent orders do not interleave.
// -----------------------------------------------------------------------------
void OrderExecutorBase::log_info(const std::string& message) const {
  std::cout << ("[" + component_ + "] " + message + "\n");
}

void OrderExecutorBase::log_warning(const std::string& message) const {
  std::cerr << ("[" + component_ + "] WARNING: " + message + "\n");
}

void OrderExecutorBase::log_error(const std::string& message) const {
  std::cerr << ("[" + component_ + "] ERROR: " + message + "\n");
}

}  // namespace ordex
