#include "ordex/venue/paper_venue_client.hpp"

#include "ordex/venue/venue_errors.hpp"

#include <condition_variable>
#include <functional>
#include <optional>
#include <utility>

namespace ordex {
namespace venue {

namespace {

// -----------------------------------------------------------------------------
// PollingSubscription<T>
// -----------------------------------------------------------------------------
// Calls `poll` every `interval` until it yields a value. close() wakes the
// waiting next() and makes every later call return std::nullopt.
// -----------------------------------------------------------------------------
template <typename T>
class PollingSubscription final : public ISubscription<T> {
 public:
  PollingSubscription(std::function<std::optional<T>()> poll,
                      std::chrono::milliseconds interval)
      : poll_(std::move(poll)), interval_(interval) {}

  std::optional<T> next() override {
    while (true) {
      {
        std::unique_lock lock(mutex_);
        condition_.wait_for(lock, interval_, [this] { return closed_; });
        if (closed_) {
          return std::nullopt;
        }
      }
      std::optional<T> value = poll_();
      if (value.has_value()) {
        return value;
      }
    }
  }

  void close() override {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

 private:
  std::function<std::optional<T>()> poll_;
  const std::chrono::milliseconds interval_;

  std::mutex mutex_;
  std::condition_variable condition_;
  bool closed_{false};
};

}  // namespace

PaperVenueClient::PaperVenueClient(Options options, ITimeProvider& time)
    : options_(std::move(options)), time_(time) {}

void PaperVenueClient::set_order_book(const domain::OrderBook& book) {
  std::lock_guard lock(mutex_);
  books_[book.symbol] = book;
}

int PaperVenueClient::margin_mode_calls(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = margin_mode_calls_.find(symbol);
  return it == margin_mode_calls_.end() ? 0 : it->second;
}

int PaperVenueClient::leverage_calls(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = leverage_calls_.find(symbol);
  return it == leverage_calls_.end() ? 0 : it->second;
}

// -----------------------------------------------------------------------------
// Order placement
// -----------------------------------------------------------------------------
domain::VenueOrder PaperVenueClient::create_limit_order(
    const std::string& symbol, domain::Side side, double amount, double price,
    const domain::OrderParams&) {
  std::lock_guard lock(mutex_);
  book_locked(symbol);
  if (!(amount > 0.0) || !(price > 0.0)) {
    throw ExchangeError("invalid limit order for " + symbol);
  }

  PaperOrder paper;
  paper.order.id = next_order_id_locked();
  paper.order.symbol = symbol;
  paper.order.status = domain::OrderStatus::Open;
  paper.order.amount = amount;
  paper.order.remaining = amount;
  paper.order.timestamp_ms = time_.now_ms();
  paper.side = side;
  paper.limit_price = price;
  paper.placed_ms = paper.order.timestamp_ms;

  refresh_locked(paper);
  auto inserted = orders_.emplace(paper.order.id, paper);
  return inserted.first->second.order;
}

domain::VenueOrder PaperVenueClient::create_market_order(
    const std::string& symbol, domain::Side side, double amount,
    const domain::OrderParams&) {
  std::lock_guard lock(mutex_);
  const domain::OrderBook& book = book_locked(symbol);
  const auto& levels = side == domain::Side::Buy ? book.asks : book.bids;
  if (levels.empty()) {
    throw ExchangeError("no liquidity for " + symbol);
  }
  if (!(amount > 0.0)) {
    throw ExchangeError("invalid market order amount for " + symbol);
  }

  PaperOrder paper;
  paper.order.id = next_order_id_locked();
  paper.order.symbol = symbol;
  paper.order.amount = amount;
  paper.order.timestamp_ms = time_.now_ms();
  paper.side = side;
  paper.placed_ms = paper.order.timestamp_ms;
  fill_locked(paper, levels.front().price);

  auto inserted = orders_.emplace(paper.order.id, paper);
  return inserted.first->second.order;
}

void PaperVenueClient::cancel_order(const std::string& order_id,
                                    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end() || it->second.order.symbol != symbol) {
    throw ExchangeError("order " + order_id + " not found");
  }
  PaperOrder& paper = it->second;
  refresh_locked(paper);
  if (paper.order.status != domain::OrderStatus::Open) {
    throw ExchangeError("order " + order_id + " is already " +
                        domain::to_string(paper.order.status));
  }
  paper.order.status = domain::OrderStatus::Canceled;
  paper.order.timestamp_ms = time_.now_ms();
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::vector<domain::VenueOrder> PaperVenueClient::fetch_open_orders(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);
  std::vector<domain::VenueOrder> open;
  for (auto& entry : orders_) {
    PaperOrder& paper = entry.second;
    if (paper.order.symbol != symbol) {
      continue;
    }
    refresh_locked(paper);
    if (paper.order.status == domain::OrderStatus::Open) {
      open.push_back(paper.order);
    }
  }
  return open;
}

domain::VenueOrder PaperVenueClient::fetch_order(const std::string& order_id,
                                                 const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end() || it->second.order.symbol != symbol) {
    throw ExchangeError("order " + order_id + " not found");
  }
  refresh_locked(it->second);
  return it->second.order;
}

domain::OrderBook PaperVenueClient::fetch_order_book(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  return book_locked(symbol);
}

void PaperVenueClient::set_margin_mode(const std::string&,
                                       const std::string& symbol) {
  std::lock_guard lock(mutex_);
  ++margin_mode_calls_[symbol];
}

void PaperVenueClient::set_leverage(int, const std::string& symbol) {
  std::lock_guard lock(mutex_);
  ++leverage_calls_[symbol];
}

// -----------------------------------------------------------------------------
// Streaming
// -----------------------------------------------------------------------------
std::unique_ptr<IBookSubscription> PaperVenueClient::subscribe_order_book(
    const std::string& symbol) {
  if (!options_.stream_support) {
    throw NetworkError(options_.id + " has no stream support");
  }
  return std::make_unique<PollingSubscription<domain::OrderBook>>(
      [this, symbol]() -> std::optional<domain::OrderBook> {
        std::lock_guard lock(mutex_);
        auto it = books_.find(symbol);
        if (it == books_.end()) {
          return std::nullopt;
        }
        return it->second;
      },
      options_.stream_interval);
}

std::unique_ptr<IOrderSubscription> PaperVenueClient::subscribe_orders(
    const std::string& symbol) {
  if (!options_.stream_support) {
    throw NetworkError(options_.id + " has no stream support");
  }
  return std::make_unique<PollingSubscription<std::vector<domain::VenueOrder>>>(
      [this, symbol]() -> std::optional<std::vector<domain::VenueOrder>> {
        std::lock_guard lock(mutex_);
        std::vector<domain::VenueOrder> batch = orders_for_locked(symbol);
        if (batch.empty()) {
          return std::nullopt;
        }
        return batch;
      },
      options_.stream_interval);
}

// -----------------------------------------------------------------------------
// Internals (mutex_ held)
// -----------------------------------------------------------------------------
const domain::OrderBook& PaperVenueClient::book_locked(
    const std::string& symbol) const {
  auto it = books_.find(symbol);
  if (it == books_.end()) {
    throw BadSymbol("unknown symbol " + symbol);
  }
  return it->second;
}

void PaperVenueClient::refresh_locked(PaperOrder& paper) {
  if (paper.order.status != domain::OrderStatus::Open) {
    return;
  }

  auto book = books_.find(paper.order.symbol);
  if (book != books_.end()) {
    const domain::OrderBook& levels = book->second;
    const bool crossed =
        paper.side == domain::Side::Buy
            ? !levels.asks.empty() && paper.limit_price >= levels.asks.front().price
            : !levels.bids.empty() && paper.limit_price <= levels.bids.front().price;
    if (crossed) {
      fill_locked(paper, paper.limit_price);
      return;
    }
  }

  if (time_.now_ms() - paper.placed_ms >= options_.passive_fill_after.count()) {
    fill_locked(paper, paper.limit_price);
  }
}

void PaperVenueClient::fill_locked(PaperOrder& paper, double price) {
  paper.order.status = domain::OrderStatus::Closed;
  paper.order.filled = paper.order.amount;
  paper.order.remaining = 0.0;
  paper.order.average_price = price;
  paper.order.last_trade_price = price;
  paper.order.timestamp_ms = time_.now_ms();
}

std::string PaperVenueClient::next_order_id_locked() {
  return options_.id + "-" + std::to_string(next_id_++);
}

std::vector<domain::VenueOrder> PaperVenueClient::orders_for_locked(
    const std::string& symbol) {
  std::vector<domain::VenueOrder> batch;
  for (auto& entry : orders_) {
    PaperOrder& paper = entry.second;
    if (paper.order.symbol != symbol) {
      continue;
    }
    refresh_locked(paper);
    batch.push_back(paper.order);
  }
  return batch;
}

}  // namespace venue
}  // namespace ordex
