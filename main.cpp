// -----------------------------------------------------------------------------
// ordex: demo entry point
//
// Runs one batch of orders against two in-memory paper venues:
//   paper-rest    request/response only  -> RestOrderExecutor
//   paper-stream  push subscriptions     -> StreamOrderExecutor
//
//   1) Load the executor config (optional JSON path argument).
//   2) Wire the event bus: LogSink, AlertSummarySink and the ZeroMQ
//      TelemetryPublisher (tcp://127.0.0.1:5557).
//   3) Seed the paper venues' books and execute a batch that mixes maker,
//      taker and one orphan order (unknown venue).
//   4) Print the reports, stop telemetry.
//
// Usage: ordex [config.json]
// -----------------------------------------------------------------------------

#include "ordex/config/executor_config.hpp"
#include "ordex/engine/batch_executor.hpp"
#include "ordex/eventbus/alert_summary_sink.hpp"
#include "ordex/eventbus/log_sink.hpp"
#include "ordex/eventbus/order_event_bus.hpp"
#include "ordex/network/telemetry_publisher.hpp"
#include "ordex/time/live_time_provider.hpp"
#include "ordex/venue/paper_venue_client.hpp"

#include <zmq.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

ordex::domain::OrderBook make_book(const std::string& symbol, double mid) {
  ordex::domain::OrderBook book;
  book.symbol = symbol;
  for (int level = 0; level < 6; ++level) {
    const double offset = mid * 0.0001 * (level + 1);
    book.bids.push_back({mid - offset, 1.0 + level});
    book.asks.push_back({mid + offset, 1.0 + level});
  }
  return book;
}

ordex::domain::OrderRequest make_request(const std::string& venue_id,
                                         const std::string& symbol,
                                         ordex::domain::Side side,
                                         ordex::domain::OrderKind kind,
                                         double amount, double price) {
  ordex::domain::OrderRequest request;
  request.venue_id = venue_id;
  request.symbol = symbol;
  request.side = side;
  request.kind = kind;
  request.amount = amount;
  if (kind == ordex::domain::OrderKind::Limit) {
    request.price = price;
    request.style = ordex::domain::ExecutionStyle::Maker;
  } else {
    request.style = ordex::domain::ExecutionStyle::Taker;
  }
  return request;
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Config
  // -------------------------------------------------------------------------
  ordex::ExecutorConfig config;
  config.max_spread_pct = 0.01;
  config.timeout_duration = std::chrono::seconds(20);
  if (argc > 1) {
    try {
      config = ordex::load_executor_config_file(argv[1]);
    } catch (const std::exception& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Event bus and sinks
  // -------------------------------------------------------------------------
  ordex::LiveTimeProvider clock;
  ordex::OrderEventBus bus;
  auto alerts = std::make_shared<ordex::AlertSummarySink>();
  auto telemetry = std::make_shared<ordex::TelemetryPublisher>();

  bus.register_sink(std::make_shared<ordex::LogSink>());
  bus.register_sink(alerts);
  try {
    telemetry->start();
    bus.register_sink(telemetry);
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] WARNING: telemetry disabled: " << e.what() << "\n";
  }

  // -------------------------------------------------------------------------
  // 3) Venues and the batch
  // -------------------------------------------------------------------------
  ordex::venue::PaperVenueClient::Options rest_options;
  rest_options.id = "paper-rest";
  rest_options.leverage = 2;
  ordex::venue::PaperVenueClient rest_venue(rest_options, clock);

  ordex::venue::PaperVenueClient::Options stream_options;
  stream_options.id = "paper-stream";
  stream_options.stream_support = true;
  stream_options.leverage = 3;
  ordex::venue::PaperVenueClient stream_venue(stream_options, clock);

  for (auto* venue : {&rest_venue, &stream_venue}) {
    venue->set_order_book(make_book("BTC/USDT", 60000.0));
    venue->set_order_book(make_book("ETH/USDT", 3000.0));
  }

  using ordex::domain::OrderKind;
  using ordex::domain::Side;

  ordex::domain::OrdersToExecute orders;
  orders.updates.push_back(make_request("paper-rest", "BTC/USDT", Side::Sell,
                                        OrderKind::Market, 0.01, 0.0));
  orders.new_orders.push_back(make_request("paper-rest", "ETH/USDT", Side::Buy,
                                           OrderKind::Limit, 0.5, 3000.0));
  orders.new_orders.push_back(make_request(
      "paper-stream", "BTC/USDT", Side::Buy, OrderKind::Limit, 0.02, 60000.0));
  orders.new_orders.push_back(make_request(
      "paper-stream", "ETH/USDT", Side::Sell, OrderKind::Market, 0.25, 0.0));
  orders.new_orders.push_back(make_request("unknown-venue", "SOL/USDT",
                                           Side::Buy, OrderKind::Market, 1.0,
                                           0.0));

  ordex::BatchExecutor executor(
      config, clock, &bus, alerts,
      [](const std::string& message) {
        std::cout << "[Notifier]\n" << message << "\n";
      });

  std::vector<ordex::venue::IVenueClient*> venues{&rest_venue, &stream_venue};
  const std::vector<ordex::domain::ExecutionReport> reports =
      executor.execute_orders(venues, orders);

  // -------------------------------------------------------------------------
  // 4) Results and shutdown
  // -------------------------------------------------------------------------
  for (const auto& report : reports) {
    std::cout << "[main] report venue=" << report.venue_id
              << " symbol=" << report.symbol << " id=" << report.id
              << " filled=" << report.filled << "/" << report.amount
              << " avg_price="
              << (report.average_price.has_value()
                      ? std::to_string(*report.average_price)
                      : std::string("none"))
              << " latency_ms=" << report.fill_latency_ms << "\n";
  }
  for (const auto& request : orders.all()) {
    if (request.pairing->is_pair_failed()) {
      std::cout << "[main] " << request.venue_id << " " << request.symbol
                << " failed\n";
    }
  }

  telemetry->stop();
  return 0;
}
