#pragma once

#include "ordex/engine/order_router.hpp"
#include "ordex/eventbus/alert_summary_sink.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ordex {

// -----------------------------------------------------------------------------
// BatchExecutor
// -----------------------------------------------------------------------------
//
// @brief  Host-facing entry point: executes one batch of orders and reports
//         how it went.
//
// @details
// execute_orders():
//   1. An empty batch is logged and returns no reports.
//   2. The batch goes through OrderRouter::route_and_collect() with an
//      ExecuteFn that finishes margin/leverage setup for the order's symbol
//      before handing it to OrderRouter::execute_order().
//   3. "filled X out of Y orders" is logged and passed to the notifier,
//      followed by the alert sink's summary when one is attached and has
//      something to say.
//
// Thread model: execute_orders() blocks until the batch finished. Not meant
// to run two batches at once on one instance.
//
// Ownership: Owns its router. Shares the alert sink with the event bus it is
// registered on.
// -----------------------------------------------------------------------------
class BatchExecutor {
 public:
  using Notifier = std::function<void(const std::string&)>;

  BatchExecutor(const ExecutorConfig& config, ITimeProvider& time,
                OrderEventBus* bus = nullptr,
                std::shared_ptr<AlertSummarySink> alerts = nullptr,
                Notifier notifier = {});

  std::vector<domain::ExecutionReport> execute_orders(
      const std::vector<venue::IVenueClient*>& venues,
      const domain::OrdersToExecute& orders);

  OrderRouter& router() { return router_; }

 private:
  void notify(const std::string& message) const;

  OrderRouter router_;
  std::shared_ptr<AlertSummarySink> alerts_;
  Notifier notifier_;
};

}  // namespace ordex
