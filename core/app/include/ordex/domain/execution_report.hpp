#pragma once

#include "ordex/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ordex {
namespace domain {

// -----------------------------------------------------------------------------
// VenueOrder
// -----------------------------------------------------------------------------
// Responsibility: One order snapshot as a venue reports it (from a create,
// fetch, or status push). Venue connectors translate their wire format into
// this struct; nothing past the venue boundary sees raw venue payloads.
//
// `average_price` is the venue's average fill price, absent until something
// filled. `remaining` is copied verbatim; ExecutionReport recomputes it.
// -----------------------------------------------------------------------------
struct VenueOrder {
  std::string id;
  std::string symbol;
  OrderStatus status{OrderStatus::Open};
  double amount{0.0};
  double filled{0.0};
  double remaining{0.0};
  std::optional<double> average_price;
  std::optional<double> last_trade_price;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// ExecutionReport
// -----------------------------------------------------------------------------
// Responsibility: The router's output contract for one order that reached a
// terminal outcome.
//
// @details
// Invariants, enforced by make_execution_report():
//   - 0 <= filled <= amount
//   - remaining == amount - filled
//   - fill_latency_ms >= 0 (submission to the snapshot that produced this)
//   - venue_id is the routing key of the venue that executed the order
//
// Thread model: Immutable value, safe to copy across threads.
// -----------------------------------------------------------------------------
struct ExecutionReport {
  std::string id;              // Venue-assigned order id
  std::string symbol;
  OrderStatus status{OrderStatus::Open};
  double amount{0.0};
  double filled{0.0};
  double remaining{0.0};
  std::optional<double> average_price;
  std::optional<double> last_price;
  std::string venue_id;
  std::int64_t fill_latency_ms{0};
  std::int64_t timestamp_ms{0};  // Epoch ms of the venue snapshot
};

// -------------------------------------------------------------------------
// make_execution_report
// -------------------------------------------------------------------------
// @brief  Builds an ExecutionReport from a venue snapshot.
//
// @param  order      Snapshot to convert.
// @param  venue_id   Routing key of the venue.
// @param  submit_ms  Epoch ms at which the order was submitted.
// @param  now_ms     Epoch ms at which the snapshot was observed.
//
// @details
// `filled` is clamped to [0, amount] and `remaining` is recomputed as
// amount - filled, so a venue that reports stale or rounded remainders can
// never break the report invariants. A zero snapshot timestamp is replaced
// with now_ms.
// -------------------------------------------------------------------------
ExecutionReport make_execution_report(const VenueOrder& order,
                                      const std::string& venue_id,
                                      std::int64_t submit_ms,
                                      std::int64_t now_ms);

}  // namespace domain
}  // namespace ordex
