// =============================================================================
// concurrency_test.cpp
// =============================================================================
// Unit tests for the threading primitives: ThreadSafeQueue<Event>,
// EventLoopThread and OrderIdGenerator.
//
// Validates:
//   - Queue: FIFO order, try_pop, timed pop_for, blocking pop wakeup
//   - Loop: events pushed from another thread are published on the worker,
//     in order; start/stop are idempotent
//   - Order ids: start at 1, unique across threads
//   - LevelManager / PositionManager: one mutating thread against several
//     readers; snapshots are always internally consistent and the final
//     state matches the writes
// =============================================================================

#include "tranche/concurrent/event_loop_thread.hpp"
#include "tranche/concurrent/order_id_generator.hpp"
#include "tranche/concurrent/thread_safe_queue.hpp"
#include "tranche/eventbus/event_bus.hpp"
#include "tranche/events/event.hpp"
#include "tranche/levels/level_manager.hpp"
#include "tranche/position/position_manager.hpp"
#include "tranche/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {

tranche::Event fillFor(tranche::domain::OrderId id) {
  tranche::FillEvent e;
  e.order_id = id;
  e.quantity = 1;
  return e;
}

// Sum of a Level's remaining exit tranches.
tranche::domain::Quantity remainingExits(const tranche::Level& level) {
  tranche::domain::Quantity sum = 0;
  for (const auto& tranche_qty : level.exitLevelStatus()) {
    sum += tranche_qty.second;
  }
  return sum;
}

tranche::domain::OrderId orderIdOf(const tranche::Event& event) {
  return std::get<tranche::FillEvent>(event).order_id;
}

}  // namespace

// -----------------------------------------------------------------------------
// ThreadSafeQueue
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, PreservesFifoOrder) {
  tranche::ThreadSafeQueue<tranche::Event> queue;
  EXPECT_TRUE(queue.empty());

  for (tranche::domain::OrderId id = 1; id <= 5; ++id) {
    queue.push(fillFor(id));
  }
  EXPECT_EQ(queue.size(), 5u);

  for (tranche::domain::OrderId id = 1; id <= 5; ++id) {
    auto event = queue.try_pop();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(orderIdOf(*event), id);
  }
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// A consumer blocked in pop() wakes when another thread pushes.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  tranche::ThreadSafeQueue<tranche::Event> queue;
  std::atomic<tranche::domain::OrderId> received{0};

  std::thread consumer(
      [&queue, &received] { received.store(orderIdOf(queue.pop())); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), 0u);

  queue.push(fillFor(42));
  consumer.join();

  EXPECT_EQ(received.load(), 42u);
}

TEST(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  tranche::ThreadSafeQueue<tranche::Event> queue;
  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(5)).has_value());

  queue.push(fillFor(7));
  auto event = queue.pop_for(std::chrono::milliseconds(5));
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(orderIdOf(*event), 7u);
}

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, PublishesPushedEventsOnWorkerInOrder) {
  constexpr int kCount = 50;

  tranche::EventLoopThread loop;
  std::mutex m;
  std::condition_variable cv;
  std::vector<tranche::domain::OrderId> seen;
  std::set<std::thread::id> threads;

  loop.eventBus().subscribe<tranche::FillEvent>(
      [&](const tranche::FillEvent& e) {
        std::lock_guard lock(m);
        seen.push_back(e.order_id);
        threads.insert(std::this_thread::get_id());
        cv.notify_one();
      });

  loop.start();
  EXPECT_TRUE(loop.isRunning());

  std::thread producer([&loop] {
    for (tranche::domain::OrderId id = 1; id <= kCount; ++id) {
      loop.push(fillFor(id));
    }
  });
  producer.join();

  {
    std::unique_lock lock(m);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&] {
      return seen.size() == static_cast<std::size_t>(kCount);
    })) << "Loop delivered " << seen.size() << " of " << kCount;
  }
  loop.stop();

  EXPECT_FALSE(loop.isRunning());
  EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));
  ASSERT_EQ(threads.size(), 1u);
  EXPECT_NE(*threads.begin(), std::this_thread::get_id());
}

TEST(EventLoopThreadTest, StartAndStopAreIdempotent) {
  tranche::EventLoopThread loop;
  EXPECT_NO_FATAL_FAILURE(loop.stop());

  loop.start();
  loop.start();
  EXPECT_TRUE(loop.isRunning());

  loop.stop();
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
}

TEST(EventLoopThreadTest, BacklogCountsUnprocessedEvents) {
  tranche::EventLoopThread loop;
  loop.push(fillFor(1));
  loop.push(fillFor(2));
  EXPECT_EQ(loop.backlog(), 2u);
}

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
TEST(OrderIdGeneratorTest, UniqueAcrossThreads) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;

  tranche::OrderIdGenerator generator;
  EXPECT_EQ(generator.peek(), 1u);

  std::vector<std::vector<tranche::domain::OrderId>> ids(kThreads);
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&generator, &ids, t] {
      for (int i = 0; i < kPerThread; ++i) {
        ids[t].push_back(generator.next_id());
      }
    });
  }
  for (auto& w : workers) w.join();

  std::set<tranche::domain::OrderId> all;
  for (const auto& v : ids) {
    all.insert(v.begin(), v.end());
  }
  EXPECT_EQ(all.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*all.begin(), 1u);
  EXPECT_EQ(*all.rbegin(), static_cast<tranche::domain::OrderId>(
                               kThreads * kPerThread));
}

// -----------------------------------------------------------------------------
// LevelManager and PositionManager under concurrent readers
// -----------------------------------------------------------------------------
TEST(SharedStateTest, ReadersSeeConsistentStateWhileOneThreadMutates) {
  using tranche::domain::Side;
  constexpr int kRounds = 300;
  constexpr int kReaders = 3;

  tranche::EventBus bus;
  tranche::LevelManager levels(bus, {1.0, 2.0, 3.0}, {0.5, 0.25, 0.0}, 3,
                               1.0);
  tranche::PositionManager book(bus, "theo", 1.0);

  std::atomic<bool> done{false};
  std::atomic<int> violations{0};
  std::atomic<std::uint64_t> reads{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < kReaders; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        const auto stats = levels.stats();
        if (stats.active_levels > levels.maxConcurrentLevels()) {
          violations.fetch_add(1);
        }
        for (const auto& level : levels.activeLevels()) {
          if (remainingExits(level) != std::llabs(level.currentPosition())) {
            violations.fetch_add(1);
          }
        }
        const auto snap = book.snapshot();
        if (snap.current_position == 0 && snap.average_price.has_value()) {
          violations.fetch_add(1);
        }
        levels.totalCurrentPosition();
        reads.fetch_add(1);
      }
    });
  }

  // Single writer: each round opens a Level, walks every exit tranche and
  // mirrors the fills on the book. Every seventh round adds a stray Buy 1.
  tranche::domain::Quantity signed_fills = 0;
  const auto t0 = tranche::ms_to_timestamp(1'700'000'000'000);
  for (int round = 0; round < kRounds; ++round) {
    const tranche::Timestamp time = t0 + std::chrono::minutes(round);
    const Side side = (round % 2 == 0) ? Side::Buy : Side::Sell;
    const Side exit_side = (side == Side::Buy) ? Side::Sell : Side::Buy;
    const tranche::domain::Quantity size = 1 + round % 5;
    const double price = 100.0 + round % 3;

    auto result = levels.createLevel(static_cast<std::size_t>(round % 3),
                                     side, size, price, 0.0, time);
    EXPECT_TRUE(result.created()) << "round " << round;
    if (!result.created()) {
      break;
    }
    EXPECT_TRUE(book.updatePosition(time, side, size, price));
    signed_fills += size * tranche::domain::sideSign(side);

    const auto id = result.level->id();
    for (std::size_t exit = 0; exit < 3; ++exit) {
      const auto exited = levels.executeExit(id, exit, price + 0.5, time);
      if (exited > 0) {
        EXPECT_TRUE(
            book.updatePosition(time, exit_side, exited, price + 0.5));
        signed_fills += exited * tranche::domain::sideSign(exit_side);
      }
    }

    if (round % 7 == 0) {
      EXPECT_TRUE(book.updatePosition(time, Side::Buy, 1, price));
      signed_fills += 1;
    }
  }

  done.store(true);
  for (auto& reader : readers) reader.join();

  EXPECT_EQ(violations.load(), 0);
  EXPECT_GT(reads.load(), 0u);

  EXPECT_EQ(levels.activeLevelCount(), 0u);
  EXPECT_EQ(levels.totalCurrentPosition(), 0);
  const auto completed = levels.completedLevels();
  ASSERT_EQ(completed.size(), static_cast<std::size_t>(kRounds));
  for (const auto& level : completed) {
    EXPECT_EQ(remainingExits(level), 0) << "level " << level.id();
    EXPECT_EQ(level.currentPosition(), 0);
  }

  EXPECT_EQ(book.currentPosition(), signed_fills);
}
