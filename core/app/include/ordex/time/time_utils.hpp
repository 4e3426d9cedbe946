#pragma once

#include <chrono>
#include <cstdint>

namespace ordex {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between the epoch-millisecond integers
//         returned by ITimeProvider and the second/duration units used by
//         ExecutorConfig and the executors' interval tables.
//
// Thread-safety: Stateless. Safe to call from any thread.
// -----------------------------------------------------------------------------

// -------------------------------------------------------------------------
// elapsed_seconds
// -------------------------------------------------------------------------
// @brief  Seconds elapsed between two epoch-millisecond readings. Clamped at
//         zero so a clock that steps backwards never yields a negative age.
// -------------------------------------------------------------------------
inline double elapsed_seconds(std::int64_t start_ms, std::int64_t now_ms) {
  if (now_ms <= start_ms) {
    return 0.0;
  }
  return static_cast<double>(now_ms - start_ms) / 1000.0;
}

// -------------------------------------------------------------------------
// seconds_to_ms
// -------------------------------------------------------------------------
// @brief  Converts a (possibly fractional) number of seconds to a
//         std::chrono::milliseconds duration, truncating below 1 ms.
// -------------------------------------------------------------------------
inline std::chrono::milliseconds seconds_to_ms(double seconds) {
  return std::chrono::milliseconds{static_cast<std::int64_t>(seconds * 1000.0)};
}

}  // namespace ordex
