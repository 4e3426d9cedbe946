#pragma once

#include "ordex/domain/order_request.hpp"
#include "ordex/events/order_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ordex {

// -----------------------------------------------------------------------------
// OrderEvent
// -----------------------------------------------------------------------------
// Responsibility: One structured lifecycle notification emitted by an
// executor onto the OrderEventBus.
//
// @details
// `event_name` is a stable machine key (order_submitted, order_fill_complete,
// order_repriced, ws_reconnect_attempt, ...). Sinks and tests match on it.
// The optional fields are overloaded by a few event kinds:
//   order_repriced        fill_price = new price, fill_qty = old price
//   ws_reconnect_attempt  latency_ms = reconnect attempt number
//
// Thread model: Plain value, copied into every sink.
// -----------------------------------------------------------------------------
struct OrderEvent {
  std::string order_id;     // Venue order id, "unknown" before placement
  std::string venue_id;
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  OrderState state{OrderState::Pending};
  std::int64_t timestamp_ms{0};
  std::string event_name;
  std::optional<std::int64_t> latency_ms;
  std::optional<double> fill_price;
  std::optional<double> fill_qty;
};

}  // namespace ordex
