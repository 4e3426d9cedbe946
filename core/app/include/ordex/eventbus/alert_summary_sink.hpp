#pragma once

#include "ordex/eventbus/i_event_sink.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace ordex {

// -----------------------------------------------------------------------------
// AlertSummarySink
// -----------------------------------------------------------------------------
//
// @brief  Buffers events for one batch and renders them as a single
//         human-readable alert message for a chat notifier.
//
// @details
// flush_summary() output:
//
//   === Order Batch Summary ===
//   filled: 2  timeout: 1  rejected: 0  orphaned: 0
//
//   [SUBMITTED] BTC/USDT buy order=17 latency=3ms
//   [FILLED] BTC/USDT buy order=17 fill=0.5@100.25 latency=812ms
//   ...
//
// Counters: FILLED -> filled, TIMED_OUT -> timeout, FAILED -> rejected,
// CANCELLED -> orphaned. Every buffered event gets a line, in arrival order;
// " fill=qty@price" appears only when both are present and " latency=Nms"
// only when latency is present.
//
// Thread model: on_event() and flush_summary() are mutex-guarded; events
// arriving during a flush land in the next summary.
// -----------------------------------------------------------------------------
class AlertSummarySink final : public IEventSink {
 public:
  AlertSummarySink() = default;

  void on_event(const OrderEvent& event) override;

  // Renders and clears the buffer. Returns "" when nothing is buffered.
  std::string flush_summary();

  std::size_t pending() const;

 private:
  mutable std::mutex mutex_;  // Protects events_
  std::vector<OrderEvent> events_;
};

}  // namespace ordex
