// =============================================================================
// order_event_bus_test.cpp
// =============================================================================
// Unit tests for ordex::OrderEventBus and its two in-process sinks.
//
// Validates:
//   - Every registered sink receives every event, in registration order
//   - A throwing sink does not stop delivery to the others
//   - Null sinks are ignored; emit on an empty bus is a no-op
//   - A sink that emits from on_event() does not deadlock
//   - LogSink line format, including "none" for absent optionals
//   - AlertSummarySink counters, per-event lines and buffer reset
//
// Design note: All tests are single-threaded apart from the concurrent emit
// test, which joins its threads before asserting.
// =============================================================================

#include "ordex/eventbus/alert_summary_sink.hpp"
#include "ordex/eventbus/log_sink.hpp"
#include "ordex/eventbus/order_event_bus.hpp"

#include "support/fake_venue.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using ordex::OrderEvent;
using ordex::OrderState;
using ordex_test::RecordingSink;

namespace {

OrderEvent make_event(const std::string& name, OrderState state,
                      const std::string& order_id = "17") {
  OrderEvent event;
  event.order_id = order_id;
  event.venue_id = "paper";
  event.symbol = "BTC/USDT";
  event.side = ordex::domain::Side::Buy;
  event.state = state;
  event.timestamp_ms = 1700000000000;
  event.event_name = name;
  return event;
}

class ThrowingSink final : public ordex::IEventSink {
 public:
  void on_event(const OrderEvent&) override {
    throw std::runtime_error("sink down");
  }
};

// Records its position in a shared call log.
class OrderedSink final : public ordex::IEventSink {
 public:
  OrderedSink(int id, std::vector<int>& log) : id_(id), log_(log) {}
  void on_event(const OrderEvent&) override { log_.push_back(id_); }

 private:
  int id_;
  std::vector<int>& log_;
};

// Re-emits a follow-up event the first time it sees "trigger".
class ReentrantSink final : public ordex::IEventSink {
 public:
  explicit ReentrantSink(ordex::OrderEventBus& bus) : bus_(bus) {}
  void on_event(const OrderEvent& event) override {
    if (event.event_name == "trigger") {
      bus_.emit(make_event("follow_up", OrderState::Pending));
    }
  }

 private:
  ordex::OrderEventBus& bus_;
};

}  // namespace

class OrderEventBusTest : public ::testing::Test {
 protected:
  ordex::OrderEventBus bus;
};

// -----------------------------------------------------------------------------
// 1. Every sink sees every event.
// -----------------------------------------------------------------------------
TEST_F(OrderEventBusTest, FansOutToAllSinks) {
  auto first = std::make_shared<RecordingSink>();
  auto second = std::make_shared<RecordingSink>();
  bus.register_sink(first);
  bus.register_sink(second);

  bus.emit(make_event("order_submitted", OrderState::Submitted));
  bus.emit(make_event("order_fill_complete", OrderState::Filled));

  EXPECT_EQ(bus.sink_count(), 2u);
  ASSERT_EQ(first->events().size(), 2u);
  ASSERT_EQ(second->events().size(), 2u);
  EXPECT_EQ(first->events()[1].event_name, "order_fill_complete");
}

// -----------------------------------------------------------------------------
// 2. Delivery follows registration order.
// -----------------------------------------------------------------------------
TEST_F(OrderEventBusTest, DeliversInRegistrationOrder) {
  std::vector<int> log;
  bus.register_sink(std::make_shared<OrderedSink>(1, log));
  bus.register_sink(std::make_shared<OrderedSink>(2, log));
  bus.register_sink(std::make_shared<OrderedSink>(3, log));

  bus.emit(make_event("order_submitted", OrderState::Submitted));

  EXPECT_EQ(log, (std::vector<int>{1, 2, 3}));
}

// -----------------------------------------------------------------------------
// 3. A sink that throws is skipped for that event only.
// Why: Telemetry or chat failures must never break order execution.
// -----------------------------------------------------------------------------
TEST_F(OrderEventBusTest, ThrowingSinkIsIsolated) {
  auto recorder = std::make_shared<RecordingSink>();
  bus.register_sink(std::make_shared<ThrowingSink>());
  bus.register_sink(recorder);

  EXPECT_NO_THROW(bus.emit(make_event("order_failed", OrderState::Failed)));
  EXPECT_NO_THROW(bus.emit(make_event("order_failed", OrderState::Failed)));
  EXPECT_EQ(recorder->events().size(), 2u);
}

// -----------------------------------------------------------------------------
// 4. Null sinks are ignored and an empty bus accepts emits.
// -----------------------------------------------------------------------------
TEST_F(OrderEventBusTest, EmptyBusAndNullSink) {
  bus.register_sink(nullptr);
  EXPECT_EQ(bus.sink_count(), 0u);
  EXPECT_NO_THROW(bus.emit(make_event("order_submitted", OrderState::Pending)));
}

// -----------------------------------------------------------------------------
// 5. Emitting from inside a sink does not deadlock.
// -----------------------------------------------------------------------------
TEST_F(OrderEventBusTest, ReentrantEmit) {
  auto recorder = std::make_shared<RecordingSink>();
  bus.register_sink(std::make_shared<ReentrantSink>(bus));
  bus.register_sink(recorder);

  bus.emit(make_event("trigger", OrderState::Pending));

  ASSERT_EQ(recorder->events().size(), 2u);
  EXPECT_EQ(recorder->events()[0].event_name, "follow_up");
  EXPECT_EQ(recorder->events()[1].event_name, "trigger");
}

// -----------------------------------------------------------------------------
// 6. Concurrent emitters lose nothing.
// -----------------------------------------------------------------------------
TEST_F(OrderEventBusTest, ConcurrentEmit) {
  auto recorder = std::make_shared<RecordingSink>();
  bus.register_sink(recorder);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 250;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < kPerThread; ++i) {
        bus.emit(make_event("order_fill_partial", OrderState::PartiallyFilled));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(recorder->events().size(),
            static_cast<std::size_t>(kThreads * kPerThread));
}

// -----------------------------------------------------------------------------
// 7. LogSink writes one key=value line per event.
// -----------------------------------------------------------------------------
TEST(LogSinkTest, FormatsKeyValueLine) {
  std::ostringstream out;
  ordex::LogSink sink(out);

  OrderEvent event = make_event("order_fill_complete", OrderState::Filled);
  event.latency_ms = 812;
  event.fill_price = 100.5;
  event.fill_qty = 1.0;
  sink.on_event(event);

  OrderEvent bare = make_event("order_submitted", OrderState::Submitted, "18");
  sink.on_event(bare);

  const std::string text = out.str();
  EXPECT_NE(text.find("[OrderEvent] order_event order_id=17 exchange_id=paper "
                      "symbol=BTC/USDT side=buy state=FILLED"),
            std::string::npos);
  EXPECT_NE(text.find("event_name=order_fill_complete latency_ms=812 "
                      "fill_price=100.5 fill_qty=1\n"),
            std::string::npos);
  EXPECT_NE(text.find("order_id=18"), std::string::npos);
  EXPECT_NE(text.find("latency_ms=none fill_price=none fill_qty=none\n"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 8. AlertSummarySink counts terminal states and lists every event.
// -----------------------------------------------------------------------------
TEST(AlertSummarySinkTest, SummarizesAndClears) {
  ordex::AlertSummarySink sink;

  OrderEvent filled = make_event("order_fill_complete", OrderState::Filled);
  filled.fill_price = 100.25;
  filled.fill_qty = 0.5;
  filled.latency_ms = 812;
  sink.on_event(filled);
  sink.on_event(make_event("order_timeout_fallback", OrderState::TimedOut, "18"));
  EXPECT_EQ(sink.pending(), 2u);

  const std::string summary = sink.flush_summary();
  EXPECT_NE(summary.find("=== Order Batch Summary ==="), std::string::npos);
  EXPECT_NE(summary.find("filled: 1"), std::string::npos);
  EXPECT_NE(summary.find("timeout: 1"), std::string::npos);
  EXPECT_NE(summary.find("rejected: 0"), std::string::npos);
  EXPECT_NE(summary.find("orphaned: 0"), std::string::npos);
  EXPECT_NE(summary.find("[FILLED] BTC/USDT buy order=17 fill=0.5@100.25 "
                         "latency=812ms"),
            std::string::npos);
  EXPECT_NE(summary.find("[TIMED_OUT] BTC/USDT buy order=18"),
            std::string::npos);

  EXPECT_EQ(sink.pending(), 0u);
  EXPECT_EQ(sink.flush_summary(), "");
}

// -----------------------------------------------------------------------------
// 9. Failed and cancelled events land in "rejected" and "orphaned".
// -----------------------------------------------------------------------------
TEST(AlertSummarySinkTest, CountsFailuresAndOrphans) {
  ordex::AlertSummarySink sink;
  sink.on_event(make_event("order_failed", OrderState::Failed));
  sink.on_event(make_event("order_failed", OrderState::Failed));
  sink.on_event(make_event("order_orphaned", OrderState::Cancelled));
  sink.on_event(make_event("order_submitted", OrderState::Submitted));

  const std::string summary = sink.flush_summary();
  EXPECT_NE(summary.find("filled: 0  timeout: 0  rejected: 2  orphaned: 1"),
            std::string::npos);
}
