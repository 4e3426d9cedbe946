#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace ordex {
namespace domain {

// -----------------------------------------------------------------------------
// Pairing
// -----------------------------------------------------------------------------
// Responsibility: Completion signal shared between the code that builds an
// order and the executor that runs it. Paired legs (e.g. the two sides of a
// spread trade) hold the same Pairing so the caller can wait for the order's
// outcome without polling the router.
//
// @details
// Two independent, monotonic flags:
//   filled  set once when the order reached CLOSED
//   failed  set once when the order was dropped, rejected, or errored
// Each notify_*() call is idempotent. Both flags may end up set if a caller
// reuses one Pairing for several orders; they never reset.
//
// Thread model: Any thread may notify; any thread may wait. A mutex guards
// the flags and a condition_variable wakes waiters.
//
// Ownership: Held by std::shared_ptr from every OrderRequest that shares it.
// -----------------------------------------------------------------------------
class Pairing {
 public:
  Pairing() = default;

  Pairing(const Pairing&) = delete;
  Pairing& operator=(const Pairing&) = delete;

  void notify_filled();
  void notify_failed();

  bool is_pair_filled() const;
  bool is_pair_failed() const;

  // -------------------------------------------------------------------------
  // wait_for_pair(timeout)
  // -------------------------------------------------------------------------
  // @brief  Blocks until either flag is set or `timeout` elapses. With no
  //         timeout, waits indefinitely.
  // @return (filled, failed) as observed when the wait ended.
  // -------------------------------------------------------------------------
  std::pair<bool, bool> wait_for_pair(
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  bool filled_{false};
  bool failed_{false};
};

}  // namespace domain
}  // namespace ordex
