#pragma once

#include "ordex/domain/execution_report.hpp"
#include "ordex/domain/order_request.hpp"
#include "ordex/venue/i_venue_client.hpp"

#include <optional>

namespace ordex {

class ExchangeSession;

// -----------------------------------------------------------------------------
// IOrderExecutor
// -----------------------------------------------------------------------------
//
// @brief  Runs one order against one venue to a terminal outcome.
//
// @details
// Implementations:
//   RestOrderExecutor    request/response polling
//   StreamOrderExecutor  push subscriptions with REST fallbacks
//
// Both calls block the calling order task until the order finishes. A
// returned report may be non-terminal only when a fallback placed an order
// the venue had not confirmed yet; std::nullopt means no fill happened.
// Failures are thrown as OrderExecutorError subclasses.
//
// `session` may be null (e.g. a standalone executor in a test); executors
// that need the circuit breaker treat null as "circuit closed".
//
// Thread model: One executor instance may run many orders concurrently;
// implementations keep per-order state on the stack.
// -----------------------------------------------------------------------------
class IOrderExecutor {
 public:
  virtual ~IOrderExecutor() = default;

  // Passive limit order, repriced as the book moves, taker fallback at the
  // deadline.
  virtual std::optional<domain::ExecutionReport> execute_maker_order(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      ExchangeSession* session) = 0;

  // Market order, monitored until terminal.
  virtual std::optional<domain::ExecutionReport> execute_taker_order(
      venue::IVenueClient& venue, const domain::OrderRequest& request,
      ExchangeSession* session) = 0;
};

}  // namespace ordex
