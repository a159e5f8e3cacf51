// =============================================================================
// ticket_lock_table_test.cpp
// =============================================================================
// Unit tests for kds::TicketLockTable: one exclusive lock per ticket id,
// entries dropped once no guard holds or waits on them.
// =============================================================================

#include "kds/concurrent/ticket_lock_table.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

class TicketLockTableTest : public ::testing::Test {
 protected:
  kds::TicketLockTable table;
};

TEST_F(TicketLockTableTest, EntryExistsOnlyWhileHeld) {
  EXPECT_EQ(table.size(), 0u);
  {
    auto guard = table.acquire(1);
    EXPECT_EQ(table.size(), 1u);
  }
  EXPECT_EQ(table.size(), 0u);
}

// -----------------------------------------------------------------------------
// Holding ticket 1 must not delay a caller locking ticket 2.
// -----------------------------------------------------------------------------
TEST_F(TicketLockTableTest, DifferentTicketsDoNotContend) {
  auto held = table.acquire(1);

  auto other = std::async(std::launch::async, [this] {
    auto guard = table.acquire(2);
    return true;
  });

  ASSERT_EQ(other.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_TRUE(other.get());
  EXPECT_EQ(table.size(), 1u);
}

// -----------------------------------------------------------------------------
// A second caller on the same ticket waits until the first guard is gone.
// -----------------------------------------------------------------------------
TEST_F(TicketLockTableTest, SameTicketIsExclusive) {
  std::atomic<bool> second_acquired{false};

  auto held = table.acquire(7);
  std::thread waiter([&] {
    auto guard = table.acquire(7);
    second_acquired.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(second_acquired.load());
  EXPECT_EQ(table.size(), 1u);

  held.reset();
  waiter.join();
  EXPECT_TRUE(second_acquired.load());
  EXPECT_EQ(table.size(), 0u);
}

TEST_F(TicketLockTableTest, CountersStayConsistentUnderLoad) {
  constexpr int kThreads = 8;
  constexpr int kIterations = 2000;
  int counter = 0;  // Guarded by the lock on ticket 3

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      for (int j = 0; j < kIterations; ++j) {
        auto guard = table.acquire(3);
        ++counter;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(counter, kThreads * kIterations);
  EXPECT_EQ(table.size(), 0u);
}
