#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace ordex {

// -----------------------------------------------------------------------------
// ConcurrencyLimiter
// -----------------------------------------------------------------------------
// Responsibility: Counting semaphore that caps how many orders may be in
// flight against one venue at the same time.
//
// Usage: every order task calls acquire() before touching the venue and keeps
// the returned Permit alive for the whole execution. The permit releases its
// slot in its destructor, so an exception thrown mid-order can never leak a
// slot.
//
// Thread model: acquire() blocks until a slot is free. All methods are safe
// from any thread. The limiter must outlive every Permit it hands out.
// -----------------------------------------------------------------------------
class ConcurrencyLimiter {
 public:
  // ---------------------------------------------------------------------------
  // Permit: RAII handle for one slot. Movable, not copyable.
  // ---------------------------------------------------------------------------
  class Permit {
   public:
    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    ~Permit();

    // Releases the slot early. Safe to call more than once.
    void release();

   private:
    friend class ConcurrencyLimiter;
    explicit Permit(ConcurrencyLimiter* owner) : owner_(owner) {}

    ConcurrencyLimiter* owner_;
  };

  explicit ConcurrencyLimiter(std::size_t max_permits);

  ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
  ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

  // Blocks until a slot is available, then takes it.
  Permit acquire();

  std::size_t capacity() const { return capacity_; }

  // Snapshot of currently free slots.
  std::size_t available() const;

 private:
  void release_slot();

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::size_t available_;
};

}  // namespace ordex
