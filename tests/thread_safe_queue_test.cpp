// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for staged::ThreadSafeQueue<T>, the outbox between the cycle
// thread and the IPC publisher.
//
// Validates:
//   - FIFO order across push/pop/try_pop
//   - pop_for() times out on an empty queue and wakes on a push
//   - drain() hands back everything queued, in order, and empties the queue
//   - No item is lost or duplicated with several producers and a draining
//     consumer
// =============================================================================

#include "staged/concurrent/thread_safe_queue.hpp"
#include "staged/events/notification.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  staged::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in the order they were pushed.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoAcrossPopAndTryPop) {
  EXPECT_TRUE(queue.empty());
  for (int i = 0; i < 10; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 10u);

  EXPECT_EQ(queue.pop(), 0);
  auto next = queue.try_pop();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(*next, 1);
  for (int i = 2; i < 10; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 2. pop_for() gives up after the timeout when nothing arrives.
// Why: The IPC loop uses a bounded wait so it can notice stop().
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  const auto start = std::chrono::steady_clock::now();
  auto item = queue.pop_for(std::chrono::milliseconds(30));
  const auto waited = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(item.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(25));
}

// -----------------------------------------------------------------------------
// 3. pop_for() wakes as soon as a producer pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] {
    auto item = queue.pop_for(std::chrono::seconds(5));
    received.store(item.value_or(-2));
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 4. drain() returns the whole backlog in order and leaves the queue empty.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, DrainReturnsBacklogInOrder) {
  EXPECT_TRUE(queue.drain().empty());

  queue.push(3);
  queue.push(1);
  queue.push(2);
  const std::vector<int> items = queue.drain();

  EXPECT_EQ(items, (std::vector<int>{3, 1, 2}));
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 5. Notifications (a std::variant) survive the queue intact.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueNotificationTest, CarriesNotificationVariants) {
  staged::ThreadSafeQueue<staged::Notification> outbox;

  staged::RiskAlertEvent alert;
  alert.severity = staged::AlertSeverity::Critical;
  alert.code = "005930";
  alert.message = "ledger save failed";
  outbox.push(alert);

  staged::CycleSummaryEvent summary;
  summary.cycle_id = 7;
  outbox.push(summary);

  auto items = outbox.drain();
  ASSERT_EQ(items.size(), 2u);
  ASSERT_TRUE(std::holds_alternative<staged::RiskAlertEvent>(items[0]));
  EXPECT_EQ(std::get<staged::RiskAlertEvent>(items[0]).code, "005930");
  ASSERT_TRUE(std::holds_alternative<staged::CycleSummaryEvent>(items[1]));
  EXPECT_EQ(std::get<staged::CycleSummaryEvent>(items[1]).cycle_id, 7);
}

// -----------------------------------------------------------------------------
// 6. Several producers, one consumer draining in batches: every value is
//    seen exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersWithDrainingConsumer) {
  constexpr int kProducers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotal = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = p * kItemsPerProducer; i < (p + 1) * kItemsPerProducer;
           ++i) {
        queue.push(i);
      }
    });
  }

  std::vector<int> seen;
  std::thread consumer([this, &seen] {
    while (static_cast<int>(seen.size()) < kTotal) {
      if (auto first = queue.pop_for(std::chrono::milliseconds(10))) {
        seen.push_back(*first);
      }
      for (int v : queue.drain()) {
        seen.push_back(v);
      }
    }
  });

  for (auto& t : producers) t.join();
  consumer.join();

  std::sort(seen.begin(), seen.end());
  ASSERT_EQ(static_cast<int>(seen.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(seen[i], i) << "Missing or duplicate item at index " << i;
  }
}
