#pragma once

namespace ordex {

// -----------------------------------------------------------------------------
// OrderState: lifecycle state carried by every OrderEvent
// -----------------------------------------------------------------------------
//
// @brief  Public states describe what happened to the order from the caller's
//         point of view; internal states name the executor's state machine
//         step at the time of the event.
//
// @details
// Public:    Pending, Submitted, PartiallyFilled, Filled, Cancelled,
//            TimedOut, Failed
// Internal:  Initializing, CreatingOrder, MonitoringOrder, UpdatingOrder,
//            WaitUntilOrderCancelled
//
// Sinks render states with to_string(), which yields the upper-case names
// (FILLED, TIMED_OUT, MONITORING_ORDER, ...). Alert summaries count the
// public terminal states only.
// -----------------------------------------------------------------------------
enum class OrderState {
  Pending,
  Submitted,
  PartiallyFilled,
  Filled,
  Cancelled,
  TimedOut,
  Failed,

  Initializing,
  CreatingOrder,
  MonitoringOrder,
  UpdatingOrder,
  WaitUntilOrderCancelled,
};

inline const char* to_string(OrderState state) {
  switch (state) {
    case OrderState::Pending:                 return "PENDING";
    case OrderState::Submitted:               return "SUBMITTED";
    case OrderState::PartiallyFilled:         return "PARTIALLY_FILLED";
    case OrderState::Filled:                  return "FILLED";
    case OrderState::Cancelled:               return "CANCELLED";
    case OrderState::TimedOut:                return "TIMED_OUT";
    case OrderState::Failed:                  return "FAILED";
    case OrderState::Initializing:            return "INITIALIZING";
    case OrderState::CreatingOrder:           return "CREATING_ORDER";
    case OrderState::MonitoringOrder:         return "MONITORING_ORDER";
    case OrderState::UpdatingOrder:           return "UPDATING_ORDER";
    case OrderState::WaitUntilOrderCancelled: return "WAIT_UNTIL_ORDER_CANCELLED";
  }
  return "UNKNOWN";
}

}  // namespace ordex
