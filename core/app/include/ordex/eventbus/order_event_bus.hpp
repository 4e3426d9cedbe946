#pragma once

#include "ordex/eventbus/i_event_sink.hpp"
#include "ordex/events/order_event.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace ordex {

// -----------------------------------------------------------------------------
// OrderEventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous fan-out of order lifecycle events to every
// registered sink, in registration order.
//
// Why in architecture: Executors never know who is listening. Logging, batch
// alert summaries and the ZeroMQ telemetry feed are all sinks on one bus, and
// tests register a recording sink to assert the exact event sequence.
//
// Thread model: register_sink() and emit() are safe from any thread. emit()
// copies the sink list under the lock and invokes sinks without holding it,
// so a sink that emits (or registers) from on_event() cannot deadlock. A
// sink registered during an emit() may miss that event.
//
// Failure isolation: a sink that throws is reported on std::cerr and the
// remaining sinks still receive the event. emit() itself never throws.
//
// Ownership: Sinks are shared; the bus keeps each registered sink alive.
// -----------------------------------------------------------------------------
class OrderEventBus {
 public:
  OrderEventBus() = default;

  OrderEventBus(const OrderEventBus&) = delete;
  OrderEventBus& operator=(const OrderEventBus&) = delete;

  // -------------------------------------------------------------------------
  // register_sink(sink)
  // -------------------------------------------------------------------------
  // What: Appends a sink. Future emits deliver to it after every sink
  // registered before it. A null sink is ignored.
  // -------------------------------------------------------------------------
  void register_sink(std::shared_ptr<IEventSink> sink);

  // -------------------------------------------------------------------------
  // emit(event)
  // -------------------------------------------------------------------------
  // What: Delivers `event` to all currently registered sinks on the calling
  // thread before returning.
  // -------------------------------------------------------------------------
  void emit(const OrderEvent& event);

  std::size_t sink_count() const;

 private:
  mutable std::mutex mutex_;  // Protects sinks_
  std::vector<std::shared_ptr<IEventSink>> sinks_;
};

}  // namespace ordex
