#include "ordex/session/exchange_session.hpp"

#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

namespace ordex {

ExchangeSession::ExchangeSession(venue::IVenueClient& venue,
                                 std::size_t max_concurrent_orders)
    : venue_(venue), limiter_(max_concurrent_orders) {}

// -----------------------------------------------------------------------------
// initialize(): stream pre-warm, best-effort
// -----------------------------------------------------------------------------
void ExchangeSession::initialize(const std::string& symbol) {
  if (!venue_.has_stream_support()) {
    return;
  }

  try {
    std::shared_ptr<venue::IBookSubscription> subscription =
        venue_.subscribe_order_book(symbol);
    // The reader owns its share of the subscription, so an unresponsive
    // feed never blocks this call past the waits below.
    std::packaged_task<std::optional<domain::OrderBook>()> read_first(
        [subscription] { return subscription->next(); });
    auto first = read_first.get_future();
    std::thread(std::move(read_first)).detach();

    if (first.wait_for(kPrewarmTimeout) != std::future_status::ready) {
      std::cerr << "[ExchangeSession] WARNING: " << venue_.id() << " " << symbol
                << " - book pre-warm timed out\n";
    }

    try {
      subscription->close();
    } catch (const std::exception& e) {
      std::cerr << "[ExchangeSession] WARNING: " << venue_.id() << " " << symbol
                << " - closing pre-warm stream failed: " << e.what() << "\n";
    }
    // close() unblocks next() if it is still waiting.
    if (first.wait_for(kPrewarmCloseTimeout) != std::future_status::ready) {
      std::cerr << "[ExchangeSession] WARNING: " << venue_.id() << " " << symbol
                << " - pre-warm reader did not stop, abandoning it\n";
      return;
    }
    first.get();
    std::cout << "[ExchangeSession] " << venue_.id() << " " << symbol
              << " - book stream pre-warmed\n";
  } catch (const std::exception& e) {
    std::cerr << "[ExchangeSession] WARNING: " << venue_.id() << " " << symbol
              << " - book pre-warm failed (non-fatal): " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// ensure_margin_initialized(): once per symbol, setters fail independently
// -----------------------------------------------------------------------------
void ExchangeSession::ensure_margin_initialized(const std::string& symbol) {
  std::lock_guard lock(margin_mutex_);
  if (margin_initialized_.count(symbol) != 0) {
    return;
  }

  try {
    venue_.set_margin_mode("isolated", symbol);
  } catch (const std::exception& e) {
    std::cerr << "[ExchangeSession] WARNING: " << venue_.id() << " " << symbol
              << " - set_margin_mode failed (non-fatal): " << e.what() << "\n";
  }

  const int leverage = venue_.leverage();
  try {
    venue_.set_leverage(leverage, symbol);
  } catch (const std::exception& e) {
    std::cerr << "[ExchangeSession] WARNING: " << venue_.id() << " " << symbol
              << " - set_leverage(" << leverage
              << ") failed (non-fatal): " << e.what() << "\n";
  }

  margin_initialized_.insert(symbol);
}

bool ExchangeSession::is_margin_initialized(const std::string& symbol) const {
  std::lock_guard lock(margin_mutex_);
  return margin_initialized_.count(symbol) != 0;
}

void ExchangeSession::mark_circuit_open() {
  if (!circuit_open_.exchange(true)) {
    std::cerr << "[ExchangeSession] WARNING: " << venue_.id()
              << " - stream circuit opened; session is now REST-only\n";
  }
}

bool ExchangeSession::is_circuit_open() const { return circuit_open_.load(); }

}  // namespace ordex
