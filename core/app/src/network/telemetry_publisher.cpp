#include "ordex/network/telemetry_publisher.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <iostream>
#include <utility>

namespace ordex {

// -----------------------------------------------------------------------------
// Constructor: store the endpoint for deferred socket creation
// -----------------------------------------------------------------------------
TelemetryPublisher::TelemetryPublisher(std::string pub_endpoint)
    : pub_endpoint_(std::move(pub_endpoint)) {}

TelemetryPublisher::~TelemetryPublisher() { stop(); }

// -----------------------------------------------------------------------------
// start(): create socket and spawn worker thread
// -----------------------------------------------------------------------------
void TelemetryPublisher::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
  pub_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[TelemetryPublisher] started. PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void TelemetryPublisher::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);

  if (thread_.joinable()) {
    thread_.join();
  }

  pub_socket_.reset();
  context_.reset();

  std::cout << "[TelemetryPublisher] stopped.\n";
}

void TelemetryPublisher::on_event(const OrderEvent& event) {
  queue_.push(event);
}

// -----------------------------------------------------------------------------
// run(): wait for events, publish, repeat until stopped
// -----------------------------------------------------------------------------
void TelemetryPublisher::run() {
  while (running_.load()) {
    auto event = queue_.pop_for(std::chrono::milliseconds(kPollTimeoutMs));
    if (!event.has_value()) {
      continue;
    }
    publish(*event);
    publish_pending();
  }

  // Final drain: publish whatever arrived before shutdown.
  publish_pending();
}

void TelemetryPublisher::publish_pending() {
  while (auto event = queue_.try_pop()) {
    publish(*event);
  }
}

void TelemetryPublisher::publish(const OrderEvent& event) {
  std::string payload = format_event(event);
  zmq::message_t msg(payload.data(), payload.size());
  try {
    // dontwait: a PUB socket at its high-water mark drops instead of
    // blocking, and reports that as an empty result.
    auto sent = pub_socket_->send(msg, zmq::send_flags::dontwait);
    if (!sent.has_value()) {
      std::cerr << "[TelemetryPublisher] WARNING: dropped "
                << event.event_name << " for order " << event.order_id
                << "\n";
    }
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    std::cerr << "[TelemetryPublisher] ERROR: send failed for "
              << event.event_name << ": " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// format_event(): OrderEvent -> JSON string
// -----------------------------------------------------------------------------
std::string TelemetryPublisher::format_event(const OrderEvent& e) {
  nlohmann::json j;
  j["type"] = "order_event";
  j["order_id"] = e.order_id;
  j["exchange_id"] = e.venue_id;
  j["symbol"] = e.symbol;
  j["side"] = domain::to_string(e.side);
  j["state"] = to_string(e.state);
  j["timestamp_ms"] = e.timestamp_ms;
  j["event_name"] = e.event_name;
  j["latency_ms"] =
      e.latency_ms.has_value() ? nlohmann::json(*e.latency_ms) : nullptr;
  j["fill_price"] =
      e.fill_price.has_value() ? nlohmann::json(*e.fill_price) : nullptr;
  j["fill_qty"] =
      e.fill_qty.has_value() ? nlohmann::json(*e.fill_qty) : nullptr;
  return j.dump();
}

}  // namespace ordex
