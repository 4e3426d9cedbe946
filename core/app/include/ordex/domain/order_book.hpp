#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ordex {
namespace domain {

// One price level of a book side.
struct BookLevel {
  double price{0.0};
  double amount{0.0};
};

// -----------------------------------------------------------------------------
// OrderBook
// -----------------------------------------------------------------------------
// Snapshot of a venue's book. `bids` are sorted best (highest) first and
// `asks` best (lowest) first, as venues deliver them.
// -----------------------------------------------------------------------------
struct OrderBook {
  std::string symbol;
  std::vector<BookLevel> bids;
  std::vector<BookLevel> asks;
  std::optional<std::int64_t> timestamp_ms;
};

// -----------------------------------------------------------------------------
// OrderBookState
// -----------------------------------------------------------------------------
// A maker's pricing decision derived from one book snapshot: the limit price
// it wants to rest at and the spread fraction (ask - bid) / bid it observed.
// -----------------------------------------------------------------------------
struct OrderBookState {
  double best_price{0.0};
  double spread_pct{0.0};
};

}  // namespace domain
}  // namespace ordex
