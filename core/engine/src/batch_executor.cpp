#include "ordex/engine/batch_executor.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace ordex {

BatchExecutor::BatchExecutor(const ExecutorConfig& config, ITimeProvider& time,
                             OrderEventBus* bus,
                             std::shared_ptr<AlertSummarySink> alerts,
                             Notifier notifier)
    : router_(config, time, bus),
      alerts_(std::move(alerts)),
      notifier_(std::move(notifier)) {}

std::vector<domain::ExecutionReport> BatchExecutor::execute_orders(
    const std::vector<venue::IVenueClient*>& venues,
    const domain::OrdersToExecute& orders) {
  if (orders.empty()) {
    std::cout << "[BatchExecutor] no orders to execute\n";
    return {};
  }

  std::vector<domain::ExecutionReport> reports = router_.route_and_collect(
      venues, orders,
      [this](venue::IVenueClient& venue, const domain::OrderRequest& request,
             ExchangeSession& session) {
        session.ensure_margin_initialized(request.symbol);
        return router_.execute_order(venue, request, session);
      });

  // route_and_collect() only keeps Closed reports.
  const std::string summary = "filled " + std::to_string(reports.size()) +
                              " out of " + std::to_string(orders.count()) +
                              " orders";
  std::cout << ("[BatchExecutor] " + summary + "\n");
  notify(summary);

  if (alerts_) {
    const std::string alert = alerts_->flush_summary();
    if (!alert.empty()) {
      notify(alert);
    }
  }
  return reports;
}

void BatchExecutor::notify(const std::string& message) const {
  if (!notifier_) {
    return;
  }
  try {
    notifier_(message);
  } catch (const std::exception& e) {
    std::cerr << ("[BatchExecutor] WARNING: notifier failed: " +
                  std::string(e.what()) + "\n");
  }
}

}  // namespace ordex
