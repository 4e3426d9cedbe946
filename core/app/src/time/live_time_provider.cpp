#include "ordex/time/live_time_provider.hpp"

#include <thread>

namespace ordex {

// -----------------------------------------------------------------------------
// now_ms(): wall-clock time in epoch milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  // time_since_epoch() gives a duration in system_clock's native tick
  // (often nanoseconds); duration_cast truncates it to whole milliseconds.
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// -----------------------------------------------------------------------------
// sleep_for(): block the calling thread
// -----------------------------------------------------------------------------
void LiveTimeProvider::sleep_for(std::chrono::milliseconds duration) {
  if (duration.count() <= 0) {
    return;
  }
  std::this_thread::sleep_for(duration);
}

}  // namespace ordex
