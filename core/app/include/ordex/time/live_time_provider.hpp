#pragma once

#include "ordex/time/i_time_provider.hpp"

namespace ordex {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock and
//         sleeps with std::this_thread::sleep_for.
//
// Thread model:
//   Stateless. Safe to share one instance between every order task.
//
// Ownership:
//   Typically created in main() and passed by reference to the router and
//   executors.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;

  void sleep_for(std::chrono::milliseconds duration) override;
};

}  // namespace ordex
