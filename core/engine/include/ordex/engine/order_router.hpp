#pragma once

#include "ordex/config/executor_config.hpp"
#include "ordex/domain/execution_report.hpp"
#include "ordex/domain/order_request.hpp"
#include "ordex/eventbus/order_event_bus.hpp"
#include "ordex/execution/rest_order_executor.hpp"
#include "ordex/execution/stream_order_executor.hpp"
#include "ordex/session/exchange_session.hpp"
#include "ordex/time/i_time_provider.hpp"
#include "ordex/venue/i_venue_client.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace ordex {

// -----------------------------------------------------------------------------
// OrderRouter
// -----------------------------------------------------------------------------
//
// @brief  Fans one batch of orders out across venues and collects the
//         reports of the orders that filled.
//
// @details
// route_and_collect() runs in two phases:
//
//   1. Grouping + session init
//      Venues are indexed by id(). An order whose venue_id matches no venue
//      is an orphan: its pairing is failed and it is dropped. The rest are
//      grouped per venue, in order (updates before new orders), each group
//      with a fresh ExchangeSession. Every session's initialize() runs
//      concurrently with the first symbol of its group.
//
//   2. Execution
//      One std::async task per order. A task holds a permit from its
//      session's limiter for the whole execution, then runs either the
//      caller's ExecuteFn or the router's own path (margin setup, then
//      execute_order()). A Closed report fails nothing and is kept; a
//      missing report, a non-Closed report or an exception fails the
//      order's pairing. One task failing never affects its siblings.
//
// Executor selection: the stream executor when the venue supports streaming
// and the session circuit is closed, otherwise REST. Market orders go to
// execute_taker_order(), limit orders to execute_maker_order().
//
// A stream order that ends with CircuitOpenError continues over REST:
//   nothing placed yet       the whole order runs on the REST executor.
//   market order placed      RestOrderExecutor::follow_order() polls it.
//   limit order placed       only amount - filled is placed again; a fully
//                            filled order is followed, and an unknown fill
//                            rethrows.
//
// The constructor validates the config (ConfigError).
//
// Thread model:
//   route_and_collect() blocks the caller until every task finished. The
//   router holds one REST and one stream executor shared by all tasks; both
//   keep per-order state on the task's stack.
//
// Ownership:
//   Borrows the venues (must outlive the call), the clock and the bus.
//   Sessions live only for the duration of one route_and_collect().
// -----------------------------------------------------------------------------
class OrderRouter {
 public:
  using ExecuteFn = std::function<std::optional<domain::ExecutionReport>(
      venue::IVenueClient&, const domain::OrderRequest&, ExchangeSession&)>;

  OrderRouter(const ExecutorConfig& config, ITimeProvider& time,
              OrderEventBus* bus = nullptr);

  OrderRouter(const OrderRouter&) = delete;
  OrderRouter& operator=(const OrderRouter&) = delete;

  std::vector<domain::ExecutionReport> route_and_collect(
      const std::vector<venue::IVenueClient*>& venues,
      const domain::OrdersToExecute& orders,
      const ExecuteFn& execute_fn = {});

  // Runs one order on the executor select_executor() picks, with the REST
  // continuation after CircuitOpenError. Does not touch margin or the pairing.
  std::optional<domain::ExecutionReport> execute_order(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      ExchangeSession& session);

  IOrderExecutor& select_executor(const venue::IVenueClient& venue,
                                  const ExchangeSession& session);

  RestOrderExecutor& rest_executor() { return rest_; }
  StreamOrderExecutor& stream_executor() { return stream_; }

 private:
  static std::optional<domain::ExecutionReport> dispatch(
      IOrderExecutor& executor, venue::IVenueClient& venue,
      const domain::OrderRequest& request, ExchangeSession& session);

  const ExecutorConfig config_;
  RestOrderExecutor rest_;
  StreamOrderExecutor stream_;
};

}  // namespace ordex
