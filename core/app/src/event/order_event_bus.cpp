#include "ordex/eventbus/order_event_bus.hpp"

#include <exception>
#include <iostream>
#include <typeinfo>
#include <utility>

namespace ordex {

// -----------------------------------------------------------------------------
// register_sink()
// -----------------------------------------------------------------------------
void OrderEventBus::register_sink(std::shared_ptr<IEventSink> sink) {
  if (!sink) {
    return;
  }
  std::lock_guard lock(mutex_);
  sinks_.push_back(std::move(sink));
}

// -----------------------------------------------------------------------------
// emit()
// -----------------------------------------------------------------------------
void OrderEventBus::emit(const OrderEvent& event) {
  std::vector<std::shared_ptr<IEventSink>> copy;
  {
    // Snapshot under the lock; sinks run without it.
    std::lock_guard lock(mutex_);
    copy = sinks_;
  }

  for (const auto& sink : copy) {
    IEventSink& target = *sink;
    try {
      target.on_event(event);
    } catch (const std::exception& e) {
      std::cerr << "[OrderEventBus] WARNING: sink " << typeid(target).name()
                << " raised for event " << event.event_name << ": "
                << e.what() << "\n";
    } catch (...) {
      std::cerr << "[OrderEventBus] WARNING: sink " << typeid(target).name()
                << " raised a non-standard exception for event "
                << event.event_name << "\n";
    }
  }
}

std::size_t OrderEventBus::sink_count() const {
  std::lock_guard lock(mutex_);
  return sinks_.size();
}

}  // namespace ordex
