#pragma once

#include "ordex/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

namespace ordex {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock for deterministic tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         and whose sleeps complete instantly.
//
// @details
// sleep_for(d) does not block. It advances the clock by d and appends d to a
// list of recorded sleeps. A REST maker order with a five minute deadline
// therefore runs to its taker fallback in microseconds, and a test can assert
// the exact backoff sequence the executor requested.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_   clock, lock-free for readers
//   std::vector<milliseconds> sleeps_       guarded by sleeps_mutex_
//
// Thread model:
//   now_ms(), advance_time() and sleep_for() may be called from any thread.
//   Concurrent sleepers each add their own delay to the shared clock, so the
//   clock is only meaningful for single-order tests.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  start_time_ms  Initial clock value. Defaults to 0 ("no time has
  //                        passed yet").
  // -------------------------------------------------------------------------
  explicit SimulationTimeProvider(std::int64_t start_time_ms = 0);

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // sleep_for(duration) override
  // -------------------------------------------------------------------------
  // @brief  Records `duration` and advances the clock by it. Never blocks.
  // -------------------------------------------------------------------------
  void sleep_for(std::chrono::milliseconds duration) override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute timestamp. Monotonicity is the
  //         caller's responsibility.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // recorded_sleeps() / clear_recorded_sleeps()
  // -------------------------------------------------------------------------
  // @brief  Snapshot (copy) of every duration passed to sleep_for(), in call
  //         order, and a way to reset it between phases of a test.
  // -------------------------------------------------------------------------
  std::vector<std::chrono::milliseconds> recorded_sleeps() const;
  void clear_recorded_sleeps();

 private:
  std::atomic<std::int64_t> current_time_ms_;

  mutable std::mutex sleeps_mutex_;  // Protects sleeps_
  std::vector<std::chrono::milliseconds> sleeps_;
};

}  // namespace ordex
