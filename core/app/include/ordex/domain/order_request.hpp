#pragma once

#include "ordex/domain/pairing.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ordex {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Trading side. Rendered on the wire and in logs as "buy" / "sell".
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* to_string(Side side) {
  switch (side) {
    case Side::Buy:  return "buy";
    case Side::Sell: return "sell";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// OrderKind / ExecutionStyle
// -----------------------------------------------------------------------------
// OrderKind is what the venue sees (limit or market). ExecutionStyle is the
// caller's intent: a Maker wants to rest on the book, a Taker wants to cross.
// The router dispatches on OrderKind.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Limit,
  Market,
};

inline const char* to_string(OrderKind kind) {
  switch (kind) {
    case OrderKind::Limit:  return "limit";
    case OrderKind::Market: return "market";
  }
  return "unknown";
}

enum class ExecutionStyle {
  Maker,
  Taker,
};

// Venue-specific order parameters, passed through to the venue untouched.
using OrderParams = std::map<std::string, std::string>;

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Responsibility: The caller's intent for one order, as produced by the
// (external) order builder. Executors only read it.
//
// @details
// `pairing` is shared: copies of a request, including the one returned by
// with_kind(), resolve the same Pairing. `price` is the caller's reference
// price; makers derive their own limit price from the live book.
//
// Thread model: Value type. Treat as immutable once handed to the router.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string symbol;                       // Venue symbol, e.g. "BTC/USDT:USDT"
  Side side{Side::Buy};
  OrderKind kind{OrderKind::Limit};
  double amount{0.0};                       // Base quantity, must be > 0
  std::optional<double> price;              // Required (> 0) for limit orders
  ExecutionStyle style{ExecutionStyle::Maker};
  std::string venue_id;                     // Routing key into the venue map
  OrderParams params;
  std::shared_ptr<Pairing> pairing{std::make_shared<Pairing>()};
  std::string notes;

  // Copy with a different kind that shares this request's Pairing.
  OrderRequest with_kind(OrderKind new_kind) const {
    OrderRequest copy = *this;
    copy.kind = new_kind;
    return copy;
  }
};

// -----------------------------------------------------------------------------
// OrdersToExecute
// -----------------------------------------------------------------------------
// One batch for the router. `updates` (orders that resize existing positions)
// run ahead of `new_orders` so capital is released before it is consumed.
// -----------------------------------------------------------------------------
struct OrdersToExecute {
  std::vector<OrderRequest> updates;
  std::vector<OrderRequest> new_orders;

  std::size_t count() const { return updates.size() + new_orders.size(); }

  bool empty() const { return count() == 0; }

  // Updates first, then new orders, each group in its original order.
  std::vector<OrderRequest> all() const {
    std::vector<OrderRequest> out;
    out.reserve(count());
    out.insert(out.end(), updates.begin(), updates.end());
    out.insert(out.end(), new_orders.begin(), new_orders.end());
    return out;
  }
};

}  // namespace domain
}  // namespace ordex
