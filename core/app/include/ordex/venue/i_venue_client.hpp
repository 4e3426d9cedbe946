#pragma once

#include "ordex/domain/execution_report.hpp"
#include "ordex/domain/order_book.hpp"
#include "ordex/domain/order_request.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ordex {
namespace venue {

// -----------------------------------------------------------------------------
// ISubscription<T>: one push stream from a venue
// -----------------------------------------------------------------------------
//
// @brief  Blocking pull interface over a venue push feed (book snapshots or
//         order-status batches).
//
// @details
// next() blocks until the venue delivers the next item. It returns
// std::nullopt once close() has been called (from any thread) or the feed
// ended. A transport failure surfaces as a thrown venue::NetworkError; the
// subscription stays usable, and the following next() call reconnects.
//
// Thread model: next() is called from one pump thread. close() may be called
// from any thread and must unblock a pending next().
//
// Ownership: Returned by IVenueClient as unique_ptr; the executor owns it for
// the lifetime of one order.
// -----------------------------------------------------------------------------
template <typename T>
class ISubscription {
 public:
  virtual ~ISubscription() = default;

  virtual std::optional<T> next() = 0;

  virtual void close() = 0;
};

using IBookSubscription = ISubscription<domain::OrderBook>;
using IOrderSubscription = ISubscription<std::vector<domain::VenueOrder>>;

// -----------------------------------------------------------------------------
// IVenueClient: the venue connectivity boundary
// -----------------------------------------------------------------------------
//
// @brief  Everything the executors need from one trading venue.
//
// @details
// Request/response calls block the calling order task and throw venue
// errors (see venue_errors.hpp) on failure. Streaming calls are only used
// when has_stream_support() is true.
//
// Thread model: Implementations must accept concurrent calls from several
// order tasks (the router runs up to max_concurrent_orders_per_exchange
// orders per venue at once).
//
// Ownership: The host owns venue clients; the router and executors borrow
// them for the duration of one batch.
// -----------------------------------------------------------------------------
class IVenueClient {
 public:
  virtual ~IVenueClient() = default;

  // Routing key, matched against OrderRequest::venue_id.
  virtual std::string id() const = 0;

  virtual bool has_stream_support() const = 0;

  // Leverage to configure for every symbol traded in a batch.
  virtual int leverage() const = 0;

  virtual domain::VenueOrder create_limit_order(
      const std::string& symbol, domain::Side side, double amount,
      double price, const domain::OrderParams& params) = 0;

  virtual domain::VenueOrder create_market_order(
      const std::string& symbol, domain::Side side, double amount,
      const domain::OrderParams& params) = 0;

  virtual void cancel_order(const std::string& order_id,
                            const std::string& symbol) = 0;

  virtual std::vector<domain::VenueOrder> fetch_open_orders(
      const std::string& symbol) = 0;

  virtual domain::VenueOrder fetch_order(const std::string& order_id,
                                         const std::string& symbol) = 0;

  virtual domain::OrderBook fetch_order_book(const std::string& symbol) = 0;

  virtual void set_margin_mode(const std::string& mode,
                               const std::string& symbol) = 0;

  virtual void set_leverage(int leverage, const std::string& symbol) = 0;

  virtual std::unique_ptr<IBookSubscription> subscribe_order_book(
      const std::string& symbol) = 0;

  virtual std::unique_ptr<IOrderSubscription> subscribe_orders(
      const std::string& symbol) = 0;
};

}  // namespace venue
}  // namespace ordex
