#pragma once

#include <chrono>
#include <cstdint>

namespace ordex {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" and "wait for
//         a while" away from std::chrono and std::this_thread.
//
// @details
// Order executors measure order age (reprice look-back, adaptive polling,
// per-order deadline) and sleep between polls and retries. If they called
// system_clock::now() and this_thread::sleep_for() directly, a test of the
// REST fetch backoff would have to wait out 0.5 s + 1 s + 2 s + 4 s of real
// time, and the recorded delays could not be asserted.
//
// ITimeProvider solves this with dependency injection:
//   - LiveTimeProvider       -> system_clock and this_thread::sleep_for.
//   - SimulationTimeProvider -> a clock advanced explicitly; sleep_for()
//                               advances it and records the delay.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent use from every order task.
//
// Ownership:
//   Components hold a reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;

  // -------------------------------------------------------------------------
  // sleep_for(duration)
  // -------------------------------------------------------------------------
  // @brief  Suspends the calling order task for the given duration.
  //
  // @details
  // Live: blocks the calling thread. Simulation: returns immediately after
  // moving the clock forward by `duration`, so code that loops on
  // "sleep, then check the deadline" still terminates.
  // -------------------------------------------------------------------------
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

}  // namespace ordex
