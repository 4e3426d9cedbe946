#pragma once

#include "ordex/eventbus/i_event_sink.hpp"

#include <iostream>
#include <mutex>
#include <string>

namespace ordex {

// -----------------------------------------------------------------------------
// LogSink
// -----------------------------------------------------------------------------
// Writes every OrderEvent as one key=value line:
//
//   [OrderEvent] order_event order_id=42 exchange_id=paper symbol=BTC/USDT
//   side=buy state=FILLED timestamp_ms=... event_name=order_fill_complete
//   latency_ms=812 fill_price=100.5 fill_qty=1
//
// Absent optionals render as "none". Writes are serialized with a mutex so
// lines from concurrent orders never interleave.
// -----------------------------------------------------------------------------
class LogSink final : public IEventSink {
 public:
  explicit LogSink(std::ostream& out = std::cout);

  void on_event(const OrderEvent& event) override;

  // The line on_event() writes, without the component prefix or newline.
  static std::string format_line(const OrderEvent& event);

 private:
  std::ostream& out_;
  std::mutex mutex_;
};

}  // namespace ordex
