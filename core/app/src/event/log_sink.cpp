#include "ordex/eventbus/log_sink.hpp"

#include <optional>
#include <sstream>

namespace ordex {

namespace {

template <typename T>
void write_optional(std::ostream& os, const std::optional<T>& value) {
  if (value.has_value()) {
    os << *value;
  } else {
    os << "none";
  }
}

}  // namespace

LogSink::LogSink(std::ostream& out) : out_(out) {}

std::string LogSink::format_line(const OrderEvent& event) {
  std::ostringstream os;
  os << "order_event"
     << " order_id=" << event.order_id
     << " exchange_id=" << event.venue_id
     << " symbol=" << event.symbol
     << " side=" << domain::to_string(event.side)
     << " state=" << to_string(event.state)
     << " timestamp_ms=" << event.timestamp_ms
     << " event_name=" << event.event_name
     << " latency_ms=";
  write_optional(os, event.latency_ms);
  os << " fill_price=";
  write_optional(os, event.fill_price);
  os << " fill_qty=";
  write_optional(os, event.fill_qty);
  return os.str();
}

void LogSink::on_event(const OrderEvent& event) {
  std::string line = format_line(event);
  std::lock_guard lock(mutex_);
  out_ << "[OrderEvent] " << line << "\n";
}

}  // namespace ordex
