#include "ordex/time/simulation_time_provider.hpp"

namespace ordex {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_time_ms)
    : current_time_ms_(start_time_ms) {}

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// sleep_for(): record the request, then jump the clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::sleep_for(std::chrono::milliseconds duration) {
  {
    std::lock_guard lock(sleeps_mutex_);
    sleeps_.push_back(duration);
  }
  // fetch_add keeps concurrent sleepers from losing each other's advance.
  current_time_ms_.fetch_add(duration.count());
}

// -----------------------------------------------------------------------------
// advance_time(): atomic write to the simulated clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

std::vector<std::chrono::milliseconds> SimulationTimeProvider::recorded_sleeps()
    const {
  std::lock_guard lock(sleeps_mutex_);
  return sleeps_;
}

void SimulationTimeProvider::clear_recorded_sleeps() {
  std::lock_guard lock(sleeps_mutex_);
  sleeps_.clear();
}

}  // namespace ordex
