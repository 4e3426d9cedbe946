// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for ordex::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering of push/pop
//   - try_pop() on empty and non-empty queues
//   - pop_for() timing out on an empty queue and waking on a push
//   - Blocking pop() waiting for a producer
//   - Multi-producer / multi-consumer delivery without loss or duplicates
//
// Threading model:
//   Threads spawned by a test are joined before its assertions run.
// =============================================================================

#include "ordex/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  ordex::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A new queue is empty.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. Items come back in the order they were pushed.
// Why: Stream signals for one order must be handled in arrival order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    queue.push(i);
  }

  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() returns nullopt on empty, the front item otherwise.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  std::optional<int> result = queue.try_pop();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 99);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 4. pop_for() on an empty queue gives up after roughly the timeout.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOut) {
  const auto start = std::chrono::steady_clock::now();
  std::optional<int> result = queue.pop_for(std::chrono::milliseconds(30));
  const auto waited = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(25));
}

// -----------------------------------------------------------------------------
// 5. pop_for() wakes as soon as another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::thread producer([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.push(7);
  });

  std::optional<int> result = queue.pop_for(std::chrono::seconds(5));
  producer.join();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 7);
}

// -----------------------------------------------------------------------------
// 6. A zero timeout behaves like try_pop().
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForZeroTimeout) {
  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(0)).has_value());
  queue.push(3);
  std::optional<int> result = queue.pop_for(std::chrono::milliseconds(0));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 3);
}

// -----------------------------------------------------------------------------
// 7. Blocking pop() waits until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);  // Still blocked

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 8. Concurrent producers and consumers: every item popped exactly once.
// How: 4 producers push disjoint ranges, 4 consumers drain with try_pop()
//      until the shared counter reaches the total.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);

  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        std::optional<int> item = queue.try_pop();
        if (item) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
