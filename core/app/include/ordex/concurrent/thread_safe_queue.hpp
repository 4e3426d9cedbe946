#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace ordex {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO queue that multiple threads can push to and pop from
// without data races. Provides blocking pop(), bounded-wait pop_for() and
// non-blocking try_pop().
//
// Why in architecture: A streaming order runs a single-threaded wait loop.
// Its book and order-status subscriptions block in next() on their own pump
// threads and push what they receive here; the loop pops one item per
// wake-up. pop_for() lets the loop wake on whichever comes first: the next
// item, the order deadline, or the staleness timer.
//
// Thread model: Safe for multiple producers and multiple consumers. All
// methods are thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Non-copyable and non-movable: std::mutex and std::condition_variable are
  // neither. Share the queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item and wakes one blocked consumer, if any.
  // Thread-safety: Safe from any thread. Notifies outside the lock so the
  // woken thread does not immediately block on the same mutex.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting as long as needed.
  // The predicate form of wait() absorbs spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout): bounded wait
  // -------------------------------------------------------------------------
  // What: Like pop(), but gives up after `timeout` and returns std::nullopt.
  // A zero or negative timeout behaves like try_pop().
  // Output: the front item, or std::nullopt if nothing arrived in time.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // empty()
  // -------------------------------------------------------------------------
  // Snapshot only: another thread may push or pop immediately after.
  // -------------------------------------------------------------------------
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

 private:
  mutable std::mutex mutex_;            // Protects queue_
  std::condition_variable condition_;   // Signalled on every push
  std::deque<T> queue_;
};

}  // namespace ordex
