#include "ordex/engine/order_router.hpp"

#include "ordex/config/executor_config.hpp"
#include "ordex/errors/executor_errors.hpp"

#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace ordex {

namespace {

void log_info(const std::string& message) {
  std::cout << ("[OrderRouter] " + message + "\n");
}

void log_warning(const std::string& message) {
  std::cerr << ("[OrderRouter] WARNING: " + message + "\n");
}

void log_error(const std::string& message) {
  std::cerr << ("[OrderRouter] ERROR: " + message + "\n");
}

// Fill quantities closer than this count as equal.
constexpr double kFillEpsilon = 1e-9;

void fail_pairing(const domain::OrderRequest& request) {
  if (request.pairing) {
    request.pairing->notify_failed();
  }
}

// One venue's share of a batch.
struct VenueBatch {
  venue::IVenueClient* venue{nullptr};
  std::unique_ptr<ExchangeSession> session;
  std::vector<const domain::OrderRequest*> orders;
};

struct OrderTask {
  VenueBatch* batch{nullptr};
  const domain::OrderRequest* request{nullptr};
  std::future<std::optional<domain::ExecutionReport>> result;
};

}  // namespace

OrderRouter::OrderRouter(const ExecutorConfig& config, ITimeProvider& time,
                         OrderEventBus* bus)
    : config_(config), rest_(config, time, bus), stream_(config, time, bus) {
  validate_executor_config(config_);
}

// -----------------------------------------------------------------------------
// select_executor() / dispatch()
// -----------------------------------------------------------------------------
IOrderExecutor& OrderRouter::select_executor(const venue::IVenueClient& venue,
                                             const ExchangeSession& session) {
  if (venue.has_stream_support() && !session.is_circuit_open()) {
    return stream_;
  }
  return rest_;
}

std::optional<domain::ExecutionReport> OrderRouter::dispatch(
    IOrderExecutor& executor, venue::IVenueClient& venue,
    const domain::OrderRequest& request, ExchangeSession& session) {
  if (request.kind == domain::OrderKind::Market) {
    return executor.execute_taker_order(venue, request, &session);
  }
  return executor.execute_maker_order(venue, request, &session);
}

std::optional<domain::ExecutionReport> OrderRouter::execute_order(
    venue::IVenueClient& venue, const domain::OrderRequest& request,
    ExchangeSession& session) {
  IOrderExecutor& executor = select_executor(venue, session);
  try {
    return dispatch(executor, venue, request, session);
  } catch (const CircuitOpenError& e) {
    if (&executor == &rest_) {
      throw;
    }
    const std::string prefix = venue.id() + " " + request.symbol;

    if (!e.placed_order_id().has_value()) {
      log_warning(prefix + " - " + e.what() + ", retrying over REST");
      return dispatch(rest_, venue, request, session);
    }
    const std::string& placed = *e.placed_order_id();

    if (request.kind == domain::OrderKind::Market) {
      log_warning(prefix + " - " + e.what() + ", following it over REST");
      return rest_.follow_order(venue, request, placed);
    }

    if (!e.filled().has_value()) {
      log_error(prefix + " - " + e.what() +
                ", fill unknown, not placing the order again");
      throw;
    }
    const double remaining = request.amount - *e.filled();
    if (remaining <= kFillEpsilon) {
      log_warning(prefix + " - " + e.what() + ", order " + placed +
                  " already filled, following it over REST");
      return rest_.follow_order(venue, request, placed);
    }

    domain::OrderRequest rest_of_order = request;
    rest_of_order.amount = remaining;
    log_warning(prefix + " - " + e.what() + ", placing the remaining " +
                std::to_string(remaining) + " over REST");
    return dispatch(rest_, venue, rest_of_order, session);
  }
}

// -----------------------------------------------------------------------------
// route_and_collect()
// -----------------------------------------------------------------------------
std::vector<domain::ExecutionReport> OrderRouter::route_and_collect(
    const std::vector<venue::IVenueClient*>& venues,
    const domain::OrdersToExecute& orders, const ExecuteFn& execute_fn) {
  std::map<std::string, venue::IVenueClient*> venues_by_id;
  for (venue::IVenueClient* venue : venues) {
    if (venue != nullptr) {
      venues_by_id[venue->id()] = venue;
    }
  }

  // --- Grouping -------------------------------------------------------------
  const std::vector<domain::OrderRequest> requests = orders.all();
  std::vector<VenueBatch> batches;
  std::map<std::string, std::size_t> batch_index;
  const auto max_in_flight = static_cast<std::size_t>(
      config_.max_concurrent_orders_per_exchange);

  for (const domain::OrderRequest& request : requests) {
    auto venue = venues_by_id.find(request.venue_id);
    if (venue == venues_by_id.end()) {
      log_warning("no venue '" + request.venue_id + "' for " +
                  request.symbol + ", failing orphan order");
      fail_pairing(request);
      continue;
    }

    auto slot = batch_index.find(request.venue_id);
    if (slot == batch_index.end()) {
      VenueBatch batch;
      batch.venue = venue->second;
      batch.session =
          std::make_unique<ExchangeSession>(*venue->second, max_in_flight);
      batches.push_back(std::move(batch));
      slot = batch_index.emplace(request.venue_id, batches.size() - 1).first;
    }
    batches[slot->second].orders.push_back(&request);
  }

  if (batches.empty()) {
    return {};
  }

  // --- Phase 1: session init ------------------------------------------------
  std::vector<std::future<void>> inits;
  inits.reserve(batches.size());
  for (VenueBatch& batch : batches) {
    const std::string symbol = batch.orders.front()->symbol;
    ExchangeSession* session = batch.session.get();
    inits.push_back(std::async(std::launch::async, [session, symbol]() {
      session->initialize(symbol);
    }));
  }
  for (std::size_t i = 0; i < inits.size(); ++i) {
    try {
      inits[i].get();
    } catch (const std::exception& e) {
      log_warning(batches[i].venue->id() + " - session init failed: " +
                  e.what());
    }
  }

  // --- Phase 2: execution ---------------------------------------------------
  std::vector<OrderTask> tasks;
  tasks.reserve(requests.size());
  for (VenueBatch& batch : batches) {
    for (const domain::OrderRequest* request : batch.orders) {
      OrderTask task;
      task.batch = &batch;
      task.request = request;
      task.result = std::async(
          std::launch::async,
          [this, &batch, request,
           &execute_fn]() -> std::optional<domain::ExecutionReport> {
            ConcurrencyLimiter::Permit permit = batch.session->limiter().acquire();
            if (execute_fn) {
              return execute_fn(*batch.venue, *request, *batch.session);
            }
            batch.session->ensure_margin_initialized(request->symbol);
            return execute_order(*batch.venue, *request, *batch.session);
          });
      tasks.push_back(std::move(task));
    }
  }

  std::vector<domain::ExecutionReport> reports;
  for (OrderTask& task : tasks) {
    const domain::OrderRequest& request = *task.request;
    const std::string prefix = task.batch->venue->id() + " " + request.symbol +
                               " " + domain::to_string(request.side);
    try {
      std::optional<domain::ExecutionReport> report = task.result.get();
      if (report.has_value() &&
          report->status == domain::OrderStatus::Closed) {
        log_info(prefix + " - order executed (id=" + report->id + ")");
        if (request.pairing) {
          request.pairing->notify_filled();
        }
        reports.push_back(std::move(*report));
      } else {
        log_warning(prefix + " - order not fully executed: " +
                    (report.has_value() ? domain::to_string(report->status)
                                        : std::string("no report")));
        fail_pairing(request);
      }
    } catch (const std::exception& e) {
      log_warning(prefix + " - order failed: " + e.what());
      fail_pairing(request);
    } catch (...) {
      log_warning(prefix + " - order failed with a non-standard exception");
      fail_pairing(request);
    }
  }

  return reports;
}

}  // namespace ordex
