#include "ordex/concurrent/concurrency_limiter.hpp"

#include <utility>

namespace ordex {

// -----------------------------------------------------------------------------
// Permit
// -----------------------------------------------------------------------------
ConcurrencyLimiter::Permit::Permit(Permit&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)) {}

ConcurrencyLimiter::Permit& ConcurrencyLimiter::Permit::operator=(
    Permit&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
  }
  return *this;
}

ConcurrencyLimiter::Permit::~Permit() { release(); }

void ConcurrencyLimiter::Permit::release() {
  if (owner_ != nullptr) {
    owner_->release_slot();
    owner_ = nullptr;
  }
}

// -----------------------------------------------------------------------------
// ConcurrencyLimiter
// -----------------------------------------------------------------------------
ConcurrencyLimiter::ConcurrencyLimiter(std::size_t max_permits)
    : capacity_(max_permits == 0 ? 1 : max_permits), available_(capacity_) {}

ConcurrencyLimiter::Permit ConcurrencyLimiter::acquire() {
  std::unique_lock lock(mutex_);
  condition_.wait(lock, [this] { return available_ > 0; });
  --available_;
  return Permit(this);
}

std::size_t ConcurrencyLimiter::available() const {
  std::lock_guard lock(mutex_);
  return available_;
}

void ConcurrencyLimiter::release_slot() {
  {
    std::lock_guard lock(mutex_);
    ++available_;
  }
  condition_.notify_one();
}

}  // namespace ordex
