#pragma once

#include "ordex/time/i_time_provider.hpp"
#include "ordex/venue/i_venue_client.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ordex {
namespace venue {

// -----------------------------------------------------------------------------
// PaperVenueClient: in-memory simulated venue
// -----------------------------------------------------------------------------
//
// @brief  An IVenueClient with no network behind it, for the demo executable
//         and end-to-end tests.
//
// @details
// Books are set by the host with set_order_book(). Fill model:
//   - Market orders fill completely at the best opposite price (ask for a
//     buy, bid for a sell) when placed. No book -> BadSymbol.
//   - Limit orders rest (Open). They fill at their limit price as soon as
//     the book crosses them (buy limit >= best ask, sell limit <= best bid)
//     or once they have rested for `passive_fill_after`.
//   - Fills are evaluated lazily on every read, against time_.now_ms().
//
// Streaming (when `stream_support` is set): subscriptions poll the in-memory
// state every `stream_interval` and return the current book / the current
// state of every order for the symbol. close() wakes a blocked next().
//
// Margin and leverage calls are only counted, for inspection.
//
// Thread model: All methods are thread-safe (one mutex over the books and
// orders). Subscriptions share the venue by pointer; the venue must outlive
// them.
// -----------------------------------------------------------------------------
class PaperVenueClient final : public IVenueClient {
 public:
  struct Options {
    std::string id{"paper"};
    bool stream_support{false};
    int leverage{1};
    std::chrono::milliseconds passive_fill_after{std::chrono::seconds(2)};
    std::chrono::milliseconds stream_interval{100};
  };

  PaperVenueClient(Options options, ITimeProvider& time);

  PaperVenueClient(const PaperVenueClient&) = delete;
  PaperVenueClient& operator=(const PaperVenueClient&) = delete;

  void set_order_book(const domain::OrderBook& book);

  int margin_mode_calls(const std::string& symbol) const;
  int leverage_calls(const std::string& symbol) const;

  std::string id() const override { return options_.id; }
  bool has_stream_support() const override { return options_.stream_support; }
  int leverage() const override { return options_.leverage; }

  domain::VenueOrder create_limit_order(
      const std::string& symbol, domain::Side side, double amount,
      double price, const domain::OrderParams& params) override;

  domain::VenueOrder create_market_order(
      const std::string& symbol, domain::Side side, double amount,
      const domain::OrderParams& params) override;

  void cancel_order(const std::string& order_id,
                    const std::string& symbol) override;

  std::vector<domain::VenueOrder> fetch_open_orders(
      const std::string& symbol) override;

  domain::VenueOrder fetch_order(const std::string& order_id,
                                 const std::string& symbol) override;

  domain::OrderBook fetch_order_book(const std::string& symbol) override;

  void set_margin_mode(const std::string& mode,
                       const std::string& symbol) override;

  void set_leverage(int leverage, const std::string& symbol) override;

  std::unique_ptr<IBookSubscription> subscribe_order_book(
      const std::string& symbol) override;

  std::unique_ptr<IOrderSubscription> subscribe_orders(
      const std::string& symbol) override;

 private:
  struct PaperOrder {
    domain::VenueOrder order;
    domain::Side side{domain::Side::Buy};
    double limit_price{0.0};
    std::int64_t placed_ms{0};
  };

  const domain::OrderBook& book_locked(const std::string& symbol) const;
  void refresh_locked(PaperOrder& paper);
  void fill_locked(PaperOrder& paper, double price);
  std::string next_order_id_locked();
  std::vector<domain::VenueOrder> orders_for_locked(const std::string& symbol);

  const Options options_;
  ITimeProvider& time_;

  mutable std::mutex mutex_;
  std::map<std::string, domain::OrderBook> books_;
  std::map<std::string, PaperOrder> orders_;
  std::map<std::string, int> margin_mode_calls_;
  std::map<std::string, int> leverage_calls_;
  std::uint64_t next_id_{1};
};

}  // namespace venue
}  // namespace ordex
