#pragma once

#include "ordex/events/order_event.hpp"

namespace ordex {

// -----------------------------------------------------------------------------
// IEventSink
// -----------------------------------------------------------------------------
// Receiver of OrderEvents registered on an OrderEventBus.
//
// on_event() runs synchronously on the emitting executor's thread, so it must
// be quick and thread-safe: several order tasks emit at the same time. A sink
// that throws is logged by the bus and skipped for that event only.
// -----------------------------------------------------------------------------
class IEventSink {
 public:
  virtual ~IEventSink() = default;

  virtual void on_event(const OrderEvent& event) = 0;
};

}  // namespace ordex
