#include "ordex/domain/execution_report.hpp"

#include <algorithm>

namespace ordex {
namespace domain {

ExecutionReport make_execution_report(const VenueOrder& order,
                                      const std::string& venue_id,
                                      std::int64_t submit_ms,
                                      std::int64_t now_ms) {
  ExecutionReport report;
  report.id = order.id;
  report.symbol = order.symbol;
  report.status = order.status;
  report.amount = std::max(0.0, order.amount);
  report.filled = std::clamp(order.filled, 0.0, report.amount);
  report.remaining = std::max(0.0, report.amount - report.filled);

  // Venues report 0 for "no price yet"; keep that as absent.
  if (order.average_price.has_value() && *order.average_price > 0.0) {
    report.average_price = order.average_price;
  }
  if (order.last_trade_price.has_value() && *order.last_trade_price > 0.0) {
    report.last_price = order.last_trade_price;
  }

  report.venue_id = venue_id;
  report.fill_latency_ms = std::max<std::int64_t>(0, now_ms - submit_ms);
  report.timestamp_ms = order.timestamp_ms != 0 ? order.timestamp_ms : now_ms;
  return report;
}

}  // namespace domain
}  // namespace ordex
