// =============================================================================
// pipeline_integration_test.cpp
// =============================================================================
// Integration tests for the full batch pipeline:
//   OrdersToExecute → BatchExecutor → OrderRouter
//     → RestOrderExecutor / StreamOrderExecutor → PaperVenueClient
//     → OrderEventBus → AlertSummarySink → notifier
//
// Validates:
//   - Market and limit orders fill on both a REST and a streaming venue
//   - Only filled orders produce reports; orphans fail their pairing
//   - Margin mode and leverage are set once per venue and symbol
//   - The notifier receives "filled X out of Y orders" and the alert summary
//   - An empty batch never reaches a venue or the notifier
//
// Design:
//   Everything runs on LiveTimeProvider with short paper-venue timings:
//   resting limit orders fill after 200ms and stream subscriptions poll every
//   20ms, so a batch completes in well under the 10s order timeout.
// =============================================================================

#include "ordex/engine/batch_executor.hpp"
#include "ordex/eventbus/alert_summary_sink.hpp"
#include "ordex/eventbus/order_event_bus.hpp"
#include "ordex/time/live_time_provider.hpp"
#include "ordex/venue/paper_venue_client.hpp"

#include "support/fake_venue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace ordex;
using ordex::domain::OrderKind;
using ordex::domain::OrderStatus;
using ordex::domain::Side;
using ordex::venue::PaperVenueClient;
using ordex_test::make_book;
using ordex_test::make_request;

// =============================================================================
// Test fixture: two paper venues, one bus with a recording and an alert sink,
// and a notifier that keeps every message.
// =============================================================================
class PipelineIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config.max_spread_pct = 0.01;
    config.timeout_duration = std::chrono::seconds(10);
    config.ws_staleness_window_s = 1.0;

    rest_venue = std::make_unique<PaperVenueClient>(
        paper_options("paper-rest", false), clock);
    stream_venue = std::make_unique<PaperVenueClient>(
        paper_options("paper-ws", true), clock);
    for (PaperVenueClient* venue : {rest_venue.get(), stream_venue.get()}) {
      venue->set_order_book(make_book(100.0, 100.05, 6, 0.01, "BTC/USDT"));
      venue->set_order_book(make_book(2000.0, 2000.5, 6, 0.1, "ETH/USDT"));
    }

    recorder = std::make_shared<ordex_test::RecordingSink>();
    alerts = std::make_shared<AlertSummarySink>();
    bus.register_sink(recorder);
    bus.register_sink(alerts);

    executor = std::make_unique<BatchExecutor>(
        config, clock, &bus, alerts, [this](const std::string& message) {
          std::lock_guard lock(messages_mutex);
          messages.push_back(message);
        });
  }

  static PaperVenueClient::Options paper_options(const std::string& id,
                                                 bool streams) {
    PaperVenueClient::Options options;
    options.id = id;
    options.stream_support = streams;
    options.leverage = 2;
    options.passive_fill_after = std::chrono::milliseconds(200);
    options.stream_interval = std::chrono::milliseconds(20);
    return options;
  }

  std::vector<venue::IVenueClient*> venues() {
    return {rest_venue.get(), stream_venue.get()};
  }

  ExecutorConfig config;
  LiveTimeProvider clock;
  OrderEventBus bus;
  std::shared_ptr<ordex_test::RecordingSink> recorder;
  std::shared_ptr<AlertSummarySink> alerts;
  std::unique_ptr<PaperVenueClient> rest_venue;
  std::unique_ptr<PaperVenueClient> stream_venue;
  std::unique_ptr<BatchExecutor> executor;

  std::mutex messages_mutex;
  std::vector<std::string> messages;
};

// -----------------------------------------------------------------------------
// 1. A mixed batch across both venues fills everything routable.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, MixedBatchAcrossVenues) {
  domain::OrdersToExecute orders;
  orders.updates.push_back(
      make_request("paper-rest", OrderKind::Market, Side::Sell, 0.5));
  orders.new_orders.push_back(make_request("paper-rest", OrderKind::Limit,
                                           Side::Buy, 0.2, "ETH/USDT"));
  orders.new_orders.push_back(
      make_request("paper-ws", OrderKind::Market, Side::Buy, 1.0));
  orders.new_orders.push_back(make_request("paper-ws", OrderKind::Limit,
                                           Side::Sell, 0.3, "ETH/USDT"));
  orders.new_orders.push_back(make_request("nowhere", OrderKind::Market));

  auto reports = executor->execute_orders(venues(), orders);

  // 1. Four fills, all Closed, each on the venue it was routed to.
  ASSERT_EQ(reports.size(), 4u);
  int rest_reports = 0;
  for (const auto& report : reports) {
    EXPECT_EQ(report.status, OrderStatus::Closed);
    EXPECT_DOUBLE_EQ(report.remaining, 0.0);
    if (report.venue_id == "paper-rest") ++rest_reports;
  }
  EXPECT_EQ(rest_reports, 2);

  // 2. Pairings: every routed order filled, the orphan failed.
  EXPECT_TRUE(orders.updates[0].pairing->is_pair_filled());
  for (std::size_t i = 0; i < 3; ++i) {
    EXPECT_TRUE(orders.new_orders[i].pairing->is_pair_filled()) << i;
  }
  EXPECT_TRUE(orders.new_orders[3].pairing->is_pair_failed());

  // 3. Margin setup once per venue and symbol.
  for (PaperVenueClient* venue : {rest_venue.get(), stream_venue.get()}) {
    EXPECT_EQ(venue->margin_mode_calls("BTC/USDT"), 1) << venue->id();
    EXPECT_EQ(venue->leverage_calls("BTC/USDT"), 1) << venue->id();
    EXPECT_EQ(venue->margin_mode_calls("ETH/USDT"), 1) << venue->id();
    EXPECT_EQ(venue->leverage_calls("ETH/USDT"), 1) << venue->id();
  }

  // 4. Notifier: the count line, then the alert summary.
  std::lock_guard lock(messages_mutex);
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0], "filled 4 out of 5 orders");
  EXPECT_EQ(messages[1].rfind("=== Order Batch Summary ===", 0), 0u);
  EXPECT_NE(messages[1].find("filled: 4"), std::string::npos);
  EXPECT_EQ(alerts->pending(), 0u);

  EXPECT_EQ(recorder->named("order_fill_complete").size(), 4u);
}

// -----------------------------------------------------------------------------
// 2. A resting maker order on the streaming venue fills at its limit price
//    once the paper venue's passive-fill delay has passed.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, StreamMakerFillsAtLimitPrice) {
  domain::OrdersToExecute orders;
  orders.new_orders.push_back(
      make_request("paper-ws", OrderKind::Limit, Side::Buy, 1.0));

  auto reports = executor->execute_orders({stream_venue.get()}, orders);

  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].venue_id, "paper-ws");
  ASSERT_TRUE(reports[0].average_price.has_value());
  // Maker orders are placed passively at the best bid.
  EXPECT_DOUBLE_EQ(*reports[0].average_price, 100.0);
  EXPECT_TRUE(orders.new_orders[0].pairing->is_pair_filled());
}

// -----------------------------------------------------------------------------
// 3. A venue without a book for the symbol rejects the order; the rest of the
//    batch still fills and the alert reports the rejection.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, UnknownSymbolIsRejected) {
  domain::OrdersToExecute orders;
  orders.new_orders.push_back(make_request("paper-rest", OrderKind::Market,
                                           Side::Buy, 1.0, "DOGE/USDT"));
  orders.new_orders.push_back(
      make_request("paper-rest", OrderKind::Market, Side::Buy, 1.0));

  auto reports = executor->execute_orders(venues(), orders);

  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].symbol, "BTC/USDT");
  EXPECT_TRUE(orders.new_orders[0].pairing->is_pair_failed());
  EXPECT_TRUE(orders.new_orders[1].pairing->is_pair_filled());

  std::lock_guard lock(messages_mutex);
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0], "filled 1 out of 2 orders");
  EXPECT_NE(messages[1].find("rejected: 1"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. An empty batch is a no-op.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, EmptyBatch) {
  auto reports = executor->execute_orders(venues(), domain::OrdersToExecute{});

  EXPECT_TRUE(reports.empty());
  EXPECT_EQ(rest_venue->margin_mode_calls("BTC/USDT"), 0);
  std::lock_guard lock(messages_mutex);
  EXPECT_TRUE(messages.empty());
}
