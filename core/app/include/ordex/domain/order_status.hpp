#pragma once

#include <stdexcept>
#include <string>

namespace ordex {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: venue-reported order status
// -----------------------------------------------------------------------------
//
// @brief  The status a venue attaches to an order snapshot.
//
// @details
//   Open      resting or partially filled
//   Closed    fully filled (terminal, success)
//   Canceled  cancelled by us or by the venue (terminal)
//   Rejected  refused by the venue (terminal)
//   Expired   time-in-force lapsed (terminal)
//
// Venue connectors report these as lowercase strings; parse_order_status()
// converts at the boundary so executors switch on the enum.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Open,
  Closed,
  Canceled,
  Rejected,
  Expired,
};

inline const char* to_string(OrderStatus status) {
  switch (status) {
    case OrderStatus::Open:     return "open";
    case OrderStatus::Closed:   return "closed";
    case OrderStatus::Canceled: return "canceled";
    case OrderStatus::Rejected: return "rejected";
    case OrderStatus::Expired:  return "expired";
  }
  return "unknown";
}

// Throws std::invalid_argument for anything outside the five known strings.
inline OrderStatus parse_order_status(const std::string& text) {
  if (text == "open") return OrderStatus::Open;
  if (text == "closed") return OrderStatus::Closed;
  if (text == "canceled" || text == "cancelled") return OrderStatus::Canceled;
  if (text == "rejected") return OrderStatus::Rejected;
  if (text == "expired") return OrderStatus::Expired;
  throw std::invalid_argument("unknown order status: " + text);
}

// Rejected and Canceled orders end a maker attempt without a fill.
inline bool is_failed_terminal(OrderStatus status) {
  return status == OrderStatus::Rejected || status == OrderStatus::Canceled;
}

}  // namespace domain
}  // namespace ordex
