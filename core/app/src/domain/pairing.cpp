#include "ordex/domain/pairing.hpp"

namespace ordex {
namespace domain {

void Pairing::notify_filled() {
  {
    std::lock_guard lock(mutex_);
    filled_ = true;
  }
  condition_.notify_all();
}

void Pairing::notify_failed() {
  {
    std::lock_guard lock(mutex_);
    failed_ = true;
  }
  condition_.notify_all();
}

bool Pairing::is_pair_filled() const {
  std::lock_guard lock(mutex_);
  return filled_;
}

bool Pairing::is_pair_failed() const {
  std::lock_guard lock(mutex_);
  return failed_;
}

std::pair<bool, bool> Pairing::wait_for_pair(
    std::optional<std::chrono::milliseconds> timeout) {
  std::unique_lock lock(mutex_);
  auto resolved = [this] { return filled_ || failed_; };
  if (timeout.has_value()) {
    condition_.wait_for(lock, *timeout, resolved);
  } else {
    condition_.wait(lock, resolved);
  }
  return {filled_, failed_};
}

}  // namespace domain
}  // namespace ordex
