#pragma once

#include "ordex/concurrent/thread_safe_queue.hpp"
#include "ordex/eventbus/i_event_sink.hpp"
#include "ordex/events/order_event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace ordex {

// -----------------------------------------------------------------------------
// TelemetryPublisher: ZeroMQ PUB feed of order lifecycle events
// -----------------------------------------------------------------------------
//
// @brief  Event sink that broadcasts every OrderEvent as a JSON message on a
//         ZeroMQ PUB socket, for dashboards and chat bots running in other
//         processes.
//
// @details
// on_event() only enqueues; a dedicated worker thread drains the queue,
// formats each event with format_event() and sends it with dontwait, so a
// slow or absent subscriber never stalls an order task.
//
// Message format (one JSON object per message):
//   {"type":"order_event","order_id":"17","exchange_id":"paper",
//    "symbol":"BTC/USDT","side":"buy","state":"FILLED",
//    "timestamp_ms":1700000000000,"event_name":"order_fill_complete",
//    "latency_ms":812,"fill_price":100.25,"fill_qty":0.5}
// Absent optionals are JSON null.
//
// Thread model:
//   start()/stop() are called from the owning thread and are idempotent.
//   on_event() is safe from any thread. The socket is touched only by the
//   worker thread.
//
// Ownership:
//   Owns the ZMQ context, the PUB socket, the queue and the worker thread.
//   Typically held by shared_ptr and registered on an OrderEventBus.
// -----------------------------------------------------------------------------
class TelemetryPublisher final : public IEventSink {
 public:
  explicit TelemetryPublisher(
      std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: joins the worker thread if still running.
  ~TelemetryPublisher() override;

  TelemetryPublisher(const TelemetryPublisher&) = delete;
  TelemetryPublisher& operator=(const TelemetryPublisher&) = delete;
  TelemetryPublisher(TelemetryPublisher&&) = delete;
  TelemetryPublisher& operator=(TelemetryPublisher&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Creates the context, binds the PUB socket and spawns the worker.
  // @throws zmq::error_t if the endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker, joins it (after it publishes what is still
  //         queued) and releases the socket and context.
  // -------------------------------------------------------------------------
  void stop();

  bool is_running() const { return running_.load(); }

  void on_event(const OrderEvent& event) override;

  // JSON wire form of one event. Pure; safe from any thread.
  static std::string format_event(const OrderEvent& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  void publish_pending();

  void publish(const OrderEvent& event);

  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<OrderEvent> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace ordex
