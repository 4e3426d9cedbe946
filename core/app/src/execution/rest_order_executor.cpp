#include "ordex/execution/rest_order_executor.hpp"

#include "ordex/errors/executor_errors.hpp"
#include "ordex/time/time_utils.hpp"

#include <exception>
#include <string>

namespace ordex {

RestOrderExecutor::RestOrderExecutor(const ExecutorConfig& config,
                                     ITimeProvider& time, OrderEventBus* bus)
    : OrderExecutorBase("RestOrderExecutor", config, time, bus) {}

std::optional<domain::OrderBookState> RestOrderExecutor::fetch_order_book_update(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    const std::optional<domain::OrderBookState>& current,
    double elapsed_seconds, const OrderContext& ctx) const {
  domain::OrderBook book;
  try {
    book = venue.fetch_order_book(request.symbol);
  } catch (const std::exception& e) {
    log_warning(ctx.log_prefix + " - error fetching order book: " + e.what());
    return std::nullopt;
  }
  return analyze_order_book(book, request.side, current, elapsed_seconds,
                            ctx.log_prefix);
}

// -----------------------------------------------------------------------------
// execute_maker_order(): state machine with taker fallback
// -----------------------------------------------------------------------------
std::optional<domain::ExecutionReport> RestOrderExecutor::execute_maker_order(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    ExchangeSession* session) {
  validate_request(request);
  OrderContext ctx = make_context(venue, request, time_.now_ms());

  cancel_pending_orders(venue, request.symbol);
  log_info(ctx.log_prefix + " - starting REST maker order execution");

  std::optional<std::string> resting_id;
  try {
    return run_maker_loop(venue, request, ctx, resting_id);
  } catch (const OrderTimeoutError& e) {
    log_info(ctx.log_prefix + " - " + e.what() + ", switching to market order");
    cancel_pending_orders(venue, request.symbol, resting_id);
    return execute_taker_order(
        venue, request.with_kind(domain::OrderKind::Market), session);
  } catch (const OrderExecutorError&) {
    cancel_pending_orders(venue, request.symbol, resting_id);
    throw;
  } catch (const std::exception& e) {
    log_info(ctx.log_prefix +
             " - maker execution interrupted, switching to market order: " +
             e.what());
    cancel_pending_orders(venue, request.symbol, resting_id);
    return execute_taker_order(
        venue, request.with_kind(domain::OrderKind::Market), session);
  }
}

domain::ExecutionReport RestOrderExecutor::run_maker_loop(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    OrderContext& ctx, std::optional<std::string>& resting_id) {
  MakerState state = MakerState::CreateOrder;
  std::optional<domain::OrderBookState> book_state;
  int fetch_failures = 0;

  while (true) {
    check_timeout(ctx.submit_ms, ctx.symbol, "maker");
    const double elapsed = elapsed_seconds(ctx.submit_ms, time_.now_ms());
    const auto interval = adaptive_poll_interval(elapsed);

    switch (state) {
      case MakerState::CreateOrder: {
        // Fresh pricing decision: the previous order is gone.
        auto priced =
            fetch_order_book_update(venue, request, std::nullopt, elapsed, ctx);
        if (!priced.has_value()) {
          break;
        }
        book_state = priced;
        if (book_state->spread_pct > config_.max_spread_pct) {
          log_info(ctx.log_prefix + " - spread too wide: " +
                   std::to_string(book_state->spread_pct));
          break;
        }

        try {
          domain::VenueOrder order = venue.create_limit_order(
              request.symbol, request.side, request.amount,
              book_state->best_price, request.params);
          ctx.order_id = order.id;
          resting_id = order.id;
          log_info(ctx.log_prefix + " - created limit order (id=" + order.id +
                   ") at " + std::to_string(book_state->best_price));
          emit(make_event(ctx, OrderState::Submitted, "order_submitted"));
          state = MakerState::MonitoringOrder;
        } catch (const std::exception& e) {
          log_warning(ctx.log_prefix + " - failed to create limit order: " +
                      e.what());
        }
        break;
      }

      case MakerState::MonitoringOrder: {
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
          log_info(ctx.log_prefix + " - order filled");
          emit(make_event(ctx, OrderState::Filled, "order_fill_complete",
                          report.average_price, report.filled));
          resting_id.reset();
          return report;
        }
        if (domain::is_failed_terminal(report.status)) {
          log_warning(ctx.log_prefix + " - order failed with status: " +
                      domain::to_string(report.status));
          emit(make_event(ctx, OrderState::Failed, "order_failed"));
          resting_id.reset();
          ctx.order_id = "unknown";
          state = MakerState::CreateOrder;
          continue;
        }
        if (report.filled > 0.0) {
          emit(make_event(ctx, OrderState::PartiallyFilled,
                          "order_fill_partial", report.average_price,
                          report.filled));
        }

        auto moved =
            fetch_order_book_update(venue, request, book_state, elapsed, ctx);
        if (moved.has_value()) {
          const double old_price =
              book_state.has_value() ? book_state->best_price : 0.0;
          if (check_should_reprice(ctx, old_price, moved->best_price,
                                   elapsed)) {
            book_state = moved;
            state = MakerState::UpdatingOrder;
          }
        }
        break;
      }

      case MakerState::UpdatingOrder: {
        try {
          cancel_order(venue, ctx);
          resting_id.reset();
          state = MakerState::WaitUntilOrderCancelled;
        } catch (const OrderCancellationError& e) {
          // The order may have filled in the meantime; monitoring will tell.
          log_warning(ctx.log_prefix + " - " + e.what());
          state = MakerState::MonitoringOrder;
        }
        break;
      }

      case MakerState::WaitUntilOrderCancelled: {
        time_.sleep_for(interval);
        ctx.order_id = "unknown";
        state = MakerState::CreateOrder;
        break;
      }
    }

    time_.sleep_for(interval);
  }
}

// -----------------------------------------------------------------------------
// execute_taker_order(): bounded create retry, then poll to terminal
// -----------------------------------------------------------------------------
std::optional<domain::ExecutionReport> RestOrderExecutor::execute_taker_order(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    ExchangeSession*) {
  validate_request(request);
  OrderContext ctx = make_context(venue, request, time_.now_ms());

  cancel_pending_orders(venue, request.symbol);
  log_info(ctx.log_prefix + " - starting REST taker order execution");

  int create_attempt = 0;
  while (true) {
    check_timeout(ctx.submit_ms, ctx.symbol, "taker");

    domain::VenueOrder created;
    try {
      created = venue.create_market_order(request.symbol, request.side,
                                          request.amount, request.params);
    } catch (const std::exception& e) {
      ++create_attempt;
      log_warning(ctx.log_prefix + " - taker create attempt " +
                  std::to_string(create_attempt) + " failed: " + e.what());
      if (create_attempt >= kTakerCreateMaxAttempts) {
        emit(make_event(ctx, OrderState::Failed, "order_failed"));
        throw OrderCreationError(request.symbol, "market", e.what());
      }
      time_.sleep_for(adaptive_poll_interval(
          elapsed_seconds(ctx.submit_ms, time_.now_ms())));
      continue;
    }

    ctx.order_id = created.id;
    emit(make_event(ctx, OrderState::Submitted, "order_submitted"));

    try {
      return poll_until_closed(venue, ctx, config_.timeout_duration);
    } catch (const OrderExecutorError&) {
      emit(make_event(ctx, OrderState::Failed, "order_failed"));
      throw;
    }
  }
}

// -----------------------------------------------------------------------------
// follow_order(): take over an order placed elsewhere
// -----------------------------------------------------------------------------
std::optional<domain::ExecutionReport> RestOrderExecutor::follow_order(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    const std::string& order_id) {
  OrderContext ctx = make_context(venue, request, time_.now_ms());
  ctx.order_id = order_id;
  log_info(ctx.log_prefix + " - following order " + order_id + " over REST");

  try {
    return poll_until_closed(venue, ctx, config_.timeout_duration);
  } catch (const OrderExecutorError&) {
    emit(make_event(ctx, OrderState::Failed, "order_failed"));
    throw;
  }
}

}  // namespace ordex
