// =============================================================================
// telemetry_publisher_test.cpp
// =============================================================================
// Unit tests for ordex::TelemetryPublisher.
//
// Validates:
//   - format_event() JSON schema, with null for absent optionals
//   - start()/stop() lifecycle, including stop() without start()
//   - Events pushed through on_event() reach a ZeroMQ SUB socket
//
// Threading model:
//   The publisher owns a worker thread. The PUB/SUB test re-emits until the
//   subscriber sees a message, which absorbs the ZeroMQ slow-joiner window.
// =============================================================================

#include "ordex/network/telemetry_publisher.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using ordex::OrderEvent;
using ordex::OrderState;
using ordex::TelemetryPublisher;

namespace {

OrderEvent make_fill_event() {
  OrderEvent event;
  event.order_id = "L1";
  event.venue_id = "paper";
  event.symbol = "ETH/USDT";
  event.side = ordex::domain::Side::Sell;
  event.state = OrderState::Filled;
  event.timestamp_ms = 1700000000123;
  event.event_name = "order_fill_complete";
  event.latency_ms = 250;
  event.fill_price = 3001.5;
  event.fill_qty = 0.25;
  return event;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Every field is present and typed.
// -----------------------------------------------------------------------------
TEST(TelemetryPublisherTest, FormatEventSchema) {
  const auto j = nlohmann::json::parse(
      TelemetryPublisher::format_event(make_fill_event()));

  EXPECT_EQ(j.at("type"), "order_event");
  EXPECT_EQ(j.at("order_id"), "L1");
  EXPECT_EQ(j.at("exchange_id"), "paper");
  EXPECT_EQ(j.at("symbol"), "ETH/USDT");
  EXPECT_EQ(j.at("side"), "sell");
  EXPECT_EQ(j.at("state"), "FILLED");
  EXPECT_EQ(j.at("timestamp_ms").get<std::int64_t>(), 1700000000123);
  EXPECT_EQ(j.at("event_name"), "order_fill_complete");
  EXPECT_EQ(j.at("latency_ms").get<std::int64_t>(), 250);
  EXPECT_DOUBLE_EQ(j.at("fill_price").get<double>(), 3001.5);
  EXPECT_DOUBLE_EQ(j.at("fill_qty").get<double>(), 0.25);
}

// -----------------------------------------------------------------------------
// 2. Absent optionals are JSON null.
// -----------------------------------------------------------------------------
TEST(TelemetryPublisherTest, FormatEventNulls) {
  OrderEvent event = make_fill_event();
  event.latency_ms.reset();
  event.fill_price.reset();
  event.fill_qty.reset();

  const auto j =
      nlohmann::json::parse(TelemetryPublisher::format_event(event));
  EXPECT_TRUE(j.at("latency_ms").is_null());
  EXPECT_TRUE(j.at("fill_price").is_null());
  EXPECT_TRUE(j.at("fill_qty").is_null());
}

// -----------------------------------------------------------------------------
// 3. Lifecycle: stop() is safe before start() and twice in a row.
// -----------------------------------------------------------------------------
TEST(TelemetryPublisherTest, StartStop) {
  TelemetryPublisher publisher("tcp://127.0.0.1:5591");
  EXPECT_FALSE(publisher.is_running());
  publisher.stop();

  publisher.start();
  EXPECT_TRUE(publisher.is_running());
  publisher.stop();
  EXPECT_FALSE(publisher.is_running());
  publisher.stop();
}

// -----------------------------------------------------------------------------
// 4. A subscriber receives the JSON of an emitted event.
// -----------------------------------------------------------------------------
TEST(TelemetryPublisherTest, PublishesToSubscriber) {
  const std::string endpoint = "tcp://127.0.0.1:5592";
  TelemetryPublisher publisher(endpoint);
  publisher.start();

  zmq::context_t context(1);
  zmq::socket_t sub(context, zmq::socket_type::sub);
  sub.set(zmq::sockopt::linger, 0);
  sub.set(zmq::sockopt::subscribe, "");
  sub.set(zmq::sockopt::rcvtimeo, 100);
  sub.connect(endpoint);

  std::optional<std::string> received;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!received.has_value() && std::chrono::steady_clock::now() < deadline) {
    publisher.on_event(make_fill_event());
    zmq::message_t message;
    auto result = sub.recv(message, zmq::recv_flags::none);
    if (result.has_value()) {
      received = message.to_string();
    }
  }
  publisher.stop();

  ASSERT_TRUE(received.has_value());
  const auto j = nlohmann::json::parse(*received);
  EXPECT_EQ(j.at("event_name"), "order_fill_complete");
  EXPECT_EQ(j.at("order_id"), "L1");
}
