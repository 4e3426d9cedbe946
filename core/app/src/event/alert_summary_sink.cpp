#include "ordex/eventbus/alert_summary_sink.hpp"

#include <sstream>

namespace ordex {

void AlertSummarySink::on_event(const OrderEvent& event) {
  std::lock_guard lock(mutex_);
  events_.push_back(event);
}

std::size_t AlertSummarySink::pending() const {
  std::lock_guard lock(mutex_);
  return events_.size();
}

// -----------------------------------------------------------------------------
// flush_summary(): swap the buffer out, then format without the lock
// -----------------------------------------------------------------------------
std::string AlertSummarySink::flush_summary() {
  std::vector<OrderEvent> events;
  {
    std::lock_guard lock(mutex_);
    events.swap(events_);
  }
  if (events.empty()) {
    return "";
  }

  int filled = 0;
  int timeout = 0;
  int rejected = 0;
  int orphaned = 0;
  for (const auto& event : events) {
    switch (event.state) {
      case OrderState::Filled:    ++filled;   break;
      case OrderState::TimedOut:  ++timeout;  break;
      case OrderState::Failed:    ++rejected; break;
      case OrderState::Cancelled: ++orphaned; break;
      default: break;
    }
  }

  std::ostringstream os;
  os << "=== Order Batch Summary ===\n"
     << "filled: " << filled << "  timeout: " << timeout
     << "  rejected: " << rejected << "  orphaned: " << orphaned << "\n"
     << "\n";

  for (std::size_t i = 0; i < events.size(); ++i) {
    const OrderEvent& event = events[i];
    os << "[" << to_string(event.state) << "] " << event.symbol << " "
       << domain::to_string(event.side) << " order=" << event.order_id;
    if (event.fill_price.has_value() && event.fill_qty.has_value()) {
      os << " fill=" << *event.fill_qty << "@" << *event.fill_price;
    }
    if (event.latency_ms.has_value()) {
      os << " latency=" << *event.latency_ms << "ms";
    }
    if (i + 1 < events.size()) {
      os << "\n";
    }
  }
  return os.str();
}

}  // namespace ordex
