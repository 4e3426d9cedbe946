#include "ordex/execution/stream_order_executor.hpp"

#include "ordex/concurrent/thread_safe_queue.hpp"
#include "ordex/errors/executor_errors.hpp"
#include "ordex/execution/rejection_classifier.hpp"
#include "ordex/session/exchange_session.hpp"
#include "ordex/time/time_utils.hpp"
#include "ordex/venue/venue_errors.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>
#include <variant>

namespace ordex {

namespace {

// Pause after a pump error that is not a handled reconnect, so a feed that
// fails instantly does not spin.
constexpr std::chrono::milliseconds kPumpErrorThrottle{100};

// -----------------------------------------------------------------------------
// StreamSignal: what the pumps hand to the order's wait loop
// -----------------------------------------------------------------------------
struct BookSignal {
  domain::OrderBook book;
};

struct BookErrorSignal {
  std::string message;
};

// `generation` identifies the order pump that produced the batch; batches
// from a pump that has since been replaced are ignored.
struct OrdersSignal {
  std::uint64_t generation;
  std::vector<domain::VenueOrder> orders;
};

struct OrdersErrorSignal {
  std::uint64_t generation;
  std::string message;
};

struct CircuitOpenSignal {
  std::exception_ptr error;
};

using StreamSignal = std::variant<BookSignal, BookErrorSignal, OrdersSignal,
                                  OrdersErrorSignal, CircuitOpenSignal>;
using SignalQueue = ThreadSafeQueue<StreamSignal>;

// -----------------------------------------------------------------------------
// SubscriptionPump<Subscription>
// -----------------------------------------------------------------------------
// Owns one subscription and the thread draining it. stop() raises the stop
// flag, closes the subscription (which unblocks next()) and joins. A stopped
// pump can be started again with a new subscription.
// -----------------------------------------------------------------------------
template <typename Subscription>
class SubscriptionPump {
 public:
  using Body = std::function<void(Subscription&, const std::atomic<bool>&)>;

  SubscriptionPump() = default;
  ~SubscriptionPump() { stop(); }

  SubscriptionPump(const SubscriptionPump&) = delete;
  SubscriptionPump& operator=(const SubscriptionPump&) = delete;

  void start(std::unique_ptr<Subscription> subscription, Body body) {
    stop();
    subscription_ = std::move(subscription);
    stopping_.store(false);
    Subscription* raw = subscription_.get();
    thread_ = std::thread(
        [this, raw, body = std::move(body)]() { body(*raw, stopping_); });
  }

  void stop() {
    stopping_.store(true);
    if (subscription_) {
      try {
        subscription_->close();
      } catch (const std::exception& e) {
        std::cerr << ("[StreamOrderExecutor] WARNING: failed to close "
                      "subscription: " +
                      std::string(e.what()) + "\n");
      }
    }
    if (thread_.joinable()) {
      thread_.join();
    }
    subscription_.reset();
  }

 private:
  std::unique_ptr<Subscription> subscription_;
  std::thread thread_;
  std::atomic<bool> stopping_{false};
};

void pump_books(venue::IBookSubscription& subscription,
                const std::atomic<bool>& stopping, SignalQueue& signals,
                ITimeProvider& time) {
  while (!stopping.load()) {
    try {
      std::optional<domain::OrderBook> book = subscription.next();
      if (!book.has_value()) {
        return;
      }
      signals.push(BookSignal{std::move(*book)});
    } catch (const std::exception& e) {
      if (stopping.load()) {
        return;
      }
      signals.push(BookErrorSignal{e.what()});
      time.sleep_for(kPumpErrorThrottle);
    }
  }
}

void pump_orders(const StreamOrderExecutor& executor,
                 venue::IOrderSubscription& subscription,
                 const std::atomic<bool>& stopping, SignalQueue& signals,
                 ITimeProvider& time, const OrderContext& ctx,
                 ExchangeSession* session, std::uint64_t generation) {
  while (!stopping.load()) {
    try {
      auto batch = executor.watch_orders_with_backoff(subscription, ctx, session);
      if (!batch.has_value()) {
        return;
      }
      signals.push(OrdersSignal{generation, std::move(*batch)});
    } catch (const CircuitOpenError&) {
      signals.push(CircuitOpenSignal{std::current_exception()});
      return;
    } catch (const std::exception& e) {
      if (stopping.load()) {
        return;
      }
      signals.push(OrdersErrorSignal{generation, e.what()});
      time.sleep_for(kPumpErrorThrottle);
    }
  }
}

}  // namespace

StreamOrderExecutor::StreamOrderExecutor(const ExecutorConfig& config,
                                         ITimeProvider& time,
                                         OrderEventBus* bus)
    : OrderExecutorBase("StreamOrderExecutor", config, time, bus) {}

std::chrono::milliseconds StreamOrderExecutor::reconnect_delay(int attempt) {
  if (attempt < 1) {
    return kBaseReconnectDelay;
  }
  // The cap is reached at attempt 10; the shift bound only guards overflow.
  const int exponent = std::min(attempt - 1, 16);
  const std::int64_t delay_ms =
      kBaseReconnectDelay.count() * (std::int64_t{1} << exponent);
  return std::chrono::milliseconds(
      std::min<std::int64_t>(delay_ms, kMaxReconnectDelay.count()));
}

std::chrono::milliseconds StreamOrderExecutor::staleness_window() const {
  return seconds_to_ms(config_.ws_staleness_window_s);
}

void StreamOrderExecutor::ensure_stream_support(
    const venue::IVenueClient& venue) const {
  if (!venue.has_stream_support()) {
    throw StreamNotSupportedError(venue.id());
  }
}

// -----------------------------------------------------------------------------
// watch_orders_with_backoff(): reconnect backoff + circuit breaker
// -----------------------------------------------------------------------------
std::optional<std::vector<domain::VenueOrder>>
StreamOrderExecutor::watch_orders_with_backoff(
    venue::IOrderSubscription& subscription, const OrderContext& ctx,
    ExchangeSession* session) const {
  if (session != nullptr && session->is_circuit_open()) {
    throw CircuitOpenError(ctx.venue_id, 0);
  }

  const int max_attempts = config_.max_ws_reconnect_attempts;
  int attempt = 0;
  while (true) {
    try {
      return subscription.next();
    } catch (const venue::NetworkError& e) {
      ++attempt;
      const auto delay = reconnect_delay(attempt);
      log_warning(ctx.log_prefix + " - order stream error (attempt " +
                  std::to_string(attempt) + "), reconnecting in " +
                  std::to_string(delay.count()) + "ms: " + e.what());
      emit(make_event(ctx, OrderState::MonitoringOrder, "ws_reconnect_attempt",
                      std::nullopt, std::nullopt, attempt));

      if (max_attempts > 0 && attempt >= max_attempts) {
        log_error(ctx.log_prefix + " - circuit breaker opening after " +
                  std::to_string(attempt) + " consecutive failures");
        if (session != nullptr) {
          session->mark_circuit_open();
        }
        emit(make_event(ctx, OrderState::Failed, "ws_circuit_open",
                        std::nullopt, std::nullopt, attempt));
        throw CircuitOpenError(ctx.venue_id, attempt);
      }

      time_.sleep_for(delay);
    }
  }
}

StreamOrderExecutor::OrderProgress StreamOrderExecutor::track_status(
    const domain::VenueOrder& snapshot, const OrderContext& ctx,
    domain::ExecutionReport& report) const {
  report = build_report(snapshot, ctx);

  if (report.status == domain::OrderStatus::Closed) {
    log_info(ctx.log_prefix + " - order filled");
    emit(make_event(ctx, OrderState::Filled, "order_fill_complete",
                    report.average_price, report.filled));
    return OrderProgress::Filled;
  }
  if (domain::is_failed_terminal(report.status)) {
    log_warning(ctx.log_prefix + " - order failed with status: " +
                domain::to_string(report.status));
    emit(make_event(ctx, OrderState::Failed, "order_failed"));
    return OrderProgress::Failed;
  }
  if (report.filled > 0.0) {
    emit(make_event(ctx, OrderState::PartiallyFilled, "order_fill_partial",
                    report.average_price, report.filled));
  }
  return OrderProgress::Working;
}

std::optional<domain::VenueOrder> StreamOrderExecutor::fetch_stale_order(
    venue::IVenueClient& venue, const OrderContext& ctx) const {
  log_info(ctx.log_prefix + " - staleness window expired, fetching order " +
           ctx.order_id + " via REST");
  try {
    domain::VenueOrder snapshot = venue.fetch_order(ctx.order_id, ctx.symbol);
    emit(make_event(ctx, OrderState::MonitoringOrder, "ws_staleness_fallback"));
    return snapshot;
  } catch (const std::exception& e) {
    log_warning(ctx.log_prefix + " - staleness fetch failed: " + e.what());
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// execute_maker_order(): event-driven maker loop
// -----------------------------------------------------------------------------
std::optional<domain::ExecutionReport> StreamOrderExecutor::execute_maker_order(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    ExchangeSession* session) {
  ensure_stream_support(venue);
  validate_request(request);
  OrderContext ctx = make_context(venue, request, time_.now_ms());

  cancel_pending_orders(venue, request.symbol);
  log_info(ctx.log_prefix + " - starting stream maker order execution");

  const std::int64_t deadline_ms =
      ctx.submit_ms + config_.timeout_duration.count();
  const std::int64_t staleness_ms = staleness_window().count();

  SignalQueue signals;
  SubscriptionPump<venue::IBookSubscription> book_pump;
  SubscriptionPump<venue::IOrderSubscription> order_pump;

  std::optional<std::string> resting_id;
  std::optional<domain::OrderBookState> book_state;
  std::uint64_t generation = 0;
  std::int64_t last_status_ms = 0;

  auto stop_streams = [&]() {
    order_pump.stop();
    book_pump.stop();
  };

  auto start_order_pump = [&]() {
    ++generation;
    std::unique_ptr<venue::IOrderSubscription> subscription;
    try {
      subscription = venue.subscribe_orders(request.symbol);
    } catch (const std::exception& e) {
      log_warning(ctx.log_prefix +
                  " - order stream unavailable, relying on staleness checks: " +
                  e.what());
      return;
    }
    const std::uint64_t pump_generation = generation;
    const OrderContext pump_ctx = ctx;
    order_pump.start(
        std::move(subscription),
        [this, &signals, pump_ctx, session, pump_generation](
            venue::IOrderSubscription& feed,
            const std::atomic<bool>& stopping) {
          pump_orders(*this, feed, stopping, signals, time_, pump_ctx,
                      session, pump_generation);
        });
  };

  auto drop_resting_order = [&]() {
    order_pump.stop();
    resting_id.reset();
    ctx.order_id = "unknown";
  };

  auto place_order = [&]() {
    if (book_state->spread_pct > config_.max_spread_pct) {
      log_info(ctx.log_prefix + " - spread too wide: " +
               std::to_string(book_state->spread_pct));
      return;
    }
    try {
      domain::VenueOrder order = venue.create_limit_order(
          request.symbol, request.side, request.amount, book_state->best_price,
          request.params);
      ctx.order_id = order.id;
      resting_id = order.id;
      log_info(ctx.log_prefix + " - created limit order (id=" + order.id +
               ") at " + std::to_string(book_state->best_price));
      emit(make_event(ctx, OrderState::Submitted, "order_submitted"));
      last_status_ms = time_.now_ms();
      start_order_pump();
    } catch (const std::exception& e) {
      if (RejectionClassifier::classify(e) == RejectionSeverity::Fatal) {
        log_error(ctx.log_prefix + " - fatal order rejection: " + e.what());
        if (request.pairing) {
          request.pairing->notify_failed();
        }
        emit(make_event(ctx, OrderState::Failed, "order_failed"));
        throw OrderCreationError(request.symbol, "limit", e.what());
      }
      log_warning(ctx.log_prefix +
                  " - transient order rejection, retrying on next update: " +
                  e.what());
    }
  };

  try {
    book_pump.start(
        venue.subscribe_order_book(request.symbol),
        [this, &signals](venue::IBookSubscription& subscription,
                         const std::atomic<bool>& stopping) {
          pump_books(subscription, stopping, signals, time_);
        });

    while (true) {
      const std::int64_t now = time_.now_ms();
      if (now >= deadline_ms) {
        throw OrderTimeoutError(
            request.symbol, "maker-ws",
            static_cast<double>(config_.timeout_duration.count()) / 1000.0);
      }

      const bool staleness_armed = resting_id.has_value() && staleness_ms > 0;
      if (staleness_armed && now - last_status_ms >= staleness_ms) {
        std::optional<domain::VenueOrder> snapshot =
            fetch_stale_order(venue, ctx);
        last_status_ms = time_.now_ms();
        if (snapshot.has_value()) {
          domain::ExecutionReport report;
          const OrderProgress progress = track_status(*snapshot, ctx, report);
          if (progress == OrderProgress::Filled) {
            resting_id.reset();
            stop_streams();
            return report;
          }
          if (progress == OrderProgress::Failed) {
            drop_resting_order();
          }
        }
        continue;
      }

      std::int64_t wait_ms = deadline_ms - now;
      if (staleness_armed) {
        wait_ms = std::min(wait_ms, last_status_ms + staleness_ms - now);
      }
      std::optional<StreamSignal> signal =
          signals.pop_for(std::chrono::milliseconds(wait_ms));
      if (!signal.has_value()) {
        continue;
      }
      const double elapsed = elapsed_seconds(ctx.submit_ms, time_.now_ms());

      if (auto* update = std::get_if<BookSignal>(&*signal)) {
        if (!resting_id.has_value()) {
          auto priced = analyze_order_book(update->book, request.side,
                                           std::nullopt, elapsed,
                                           ctx.log_prefix);
          if (priced.has_value()) {
            book_state = priced;
            place_order();
          }
          continue;
        }

        auto moved = analyze_order_book(update->book, request.side, book_state,
                                        elapsed, ctx.log_prefix);
        if (!moved.has_value()) {
          continue;
        }
        const double old_price =
            book_state.has_value() ? book_state->best_price : 0.0;
        if (!check_should_reprice(ctx, old_price, moved->best_price, elapsed)) {
          continue;
        }
        try {
          cancel_order(venue, ctx);
        } catch (const OrderCancellationError& e) {
          log_warning(ctx.log_prefix + " - " + e.what());
          continue;
        }
        drop_resting_order();
        book_state = moved;
        place_order();
        continue;
      }

      if (auto* batch = std::get_if<OrdersSignal>(&*signal)) {
        if (batch->generation != generation || !resting_id.has_value()) {
          continue;
        }
        for (const auto& snapshot : batch->orders) {
          if (snapshot.id != *resting_id) {
            continue;
          }
          last_status_ms = time_.now_ms();
          domain::ExecutionReport report;
          const OrderProgress progress = track_status(snapshot, ctx, report);
          if (progress == OrderProgress::Filled) {
            resting_id.reset();
            stop_streams();
            return report;
          }
          if (progress == OrderProgress::Failed) {
            drop_resting_order();
          }
          break;
        }
        continue;
      }

      if (auto* circuit = std::get_if<CircuitOpenSignal>(&*signal)) {
        std::rethrow_exception(circuit->error);
      }
      if (auto* book_error = std::get_if<BookErrorSignal>(&*signal)) {
        log_warning(ctx.log_prefix + " - order book stream error: " +
                    book_error->message);
        continue;
      }
      if (auto* orders_error = std::get_if<OrdersErrorSignal>(&*signal)) {
        if (orders_error->generation == generation) {
          log_warning(ctx.log_prefix + " - order stream error: " +
                      orders_error->message);
        }
      }
    }
  } catch (const OrderTimeoutError& e) {
    log_info(ctx.log_prefix + " - " + e.what() + ", falling back to taker");
    stop_streams();
    cancel_pending_orders(venue, request.symbol, resting_id);
    return execute_taker_fallback(venue, request, "ws_timeout");
  } catch (const CircuitOpenError& e) {
    stop_streams();
    if (!resting_id.has_value()) {
      cancel_pending_orders(venue, request.symbol);
      throw;
    }
    const std::string placed = *resting_id;
    cancel_pending_orders(venue, request.symbol, resting_id);

    // Read the fill after the cancel so it cannot grow afterwards.
    std::optional<double> filled;
    try {
      filled = build_report(venue.fetch_order(placed, request.symbol), ctx)
                   .filled;
    } catch (const std::exception& fetch_error) {
      log_warning(ctx.log_prefix + " - could not read fill of order " +
                  placed + ": " + fetch_error.what());
    }
    throw CircuitOpenError(e, placed, filled);
  } catch (const std::exception&) {
    stop_streams();
    cancel_pending_orders(venue, request.symbol, resting_id);
    throw;
  }
}

// -----------------------------------------------------------------------------
// execute_taker_order(): market order followed by status pushes
// -----------------------------------------------------------------------------
std::optional<domain::ExecutionReport> StreamOrderExecutor::execute_taker_order(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    ExchangeSession* session) {
  ensure_stream_support(venue);
  validate_request(request);
  OrderContext ctx = make_context(venue, request, time_.now_ms());

  cancel_pending_orders(venue, request.symbol);
  log_info(ctx.log_prefix + " - starting stream taker order execution");

  const std::int64_t deadline_ms =
      ctx.submit_ms + config_.timeout_duration.count();
  const std::int64_t staleness_ms = staleness_window().count();

  domain::VenueOrder created;
  try {
    created = venue.create_market_order(request.symbol, request.side,
                                        request.amount, request.params);
  } catch (const std::exception& e) {
    log_warning(ctx.log_prefix + " - failed to create market order: " +
                e.what());
    emit(make_event(ctx, OrderState::Failed, "order_failed"));
    throw OrderCreationError(request.symbol, "market", e.what());
  }
  ctx.order_id = created.id;
  emit(make_event(ctx, OrderState::Submitted, "order_submitted"));

  SignalQueue signals;
  SubscriptionPump<venue::IOrderSubscription> order_pump;
  domain::ExecutionReport report;

  try {
    OrderProgress progress = track_status(created, ctx, report);
    if (progress == OrderProgress::Filled) {
      return report;
    }
    if (progress == OrderProgress::Failed) {
      throw OrderCreationError(
          request.symbol, "market",
          std::string("order was ") + domain::to_string(report.status));
    }

    try {
      const OrderContext pump_ctx = ctx;
      order_pump.start(
          venue.subscribe_orders(request.symbol),
          [this, &signals, pump_ctx, session](
              venue::IOrderSubscription& subscription,
              const std::atomic<bool>& stopping) {
            pump_orders(*this, subscription, stopping, signals, time_,
                        pump_ctx, session, 1);
          });
    } catch (const std::exception& e) {
      log_warning(ctx.log_prefix +
                  " - order stream unavailable, relying on staleness checks: " +
                  e.what());
    }

    std::int64_t last_status_ms = time_.now_ms();
    while (true) {
      const std::int64_t now = time_.now_ms();
      if (now >= deadline_ms) {
        throw OrderTimeoutError(
            request.symbol, "market",
            static_cast<double>(config_.timeout_duration.count()) / 1000.0);
      }

      std::optional<domain::VenueOrder> observed;
      if (staleness_ms > 0 && now - last_status_ms >= staleness_ms) {
        observed = fetch_stale_order(venue, ctx);
        last_status_ms = time_.now_ms();
      } else {
        std::int64_t wait_ms = deadline_ms - now;
        if (staleness_ms > 0) {
          wait_ms = std::min(wait_ms, last_status_ms + staleness_ms - now);
        }
        std::optional<StreamSignal> signal =
            signals.pop_for(std::chrono::milliseconds(wait_ms));
        if (!signal.has_value()) {
          continue;
        }
        if (auto* circuit = std::get_if<CircuitOpenSignal>(&*signal)) {
          std::rethrow_exception(circuit->error);
        }
        if (auto* orders_error = std::get_if<OrdersErrorSignal>(&*signal)) {
          log_warning(ctx.log_prefix + " - order stream error: " +
                      orders_error->message);
          continue;
        }
        if (auto* batch = std::get_if<OrdersSignal>(&*signal)) {
          for (const auto& snapshot : batch->orders) {
            if (snapshot.id == ctx.order_id) {
              observed = snapshot;
              last_status_ms = time_.now_ms();
              break;
            }
          }
        }
      }

      if (!observed.has_value()) {
        continue;
      }
      progress = track_status(*observed, ctx, report);
      if (progress == OrderProgress::Filled) {
        order_pump.stop();
        return report;
      }
      if (progress == OrderProgress::Failed) {
        throw OrderCreationError(
            request.symbol, "market",
            std::string("order was ") + domain::to_string(report.status));
      }
    }
  } catch (const CircuitOpenError& e) {
    // The market order stays live; the caller follows it by id.
    order_pump.stop();
    throw CircuitOpenError(e, ctx.order_id, report.filled);
  } catch (const std::exception&) {
    order_pump.stop();
    cancel_pending_orders(venue, request.symbol);
    throw;
  }
}

}  // namespace ordex
