#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "Session/WorkerPool.hpp"

TEST(WorkerPoolTest, RunsJobsAndJoinsOnShutdown) {
  WorkerPool pool;
  std::atomic<int> ran{0};
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(pool.spawn("job" + std::to_string(i), [&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      ran.fetch_add(1);
    }));
  }
  pool.shutdown();
  EXPECT_EQ(ran.load(), 4);
  EXPECT_EQ(pool.running(), 0u);
}

TEST(WorkerPoolTest, RefusesJobsAfterShutdown) {
  WorkerPool pool;
  pool.shutdown();
  EXPECT_FALSE(pool.spawn("late", []() {}));
}

TEST(WorkerPoolTest, ThrowingJobDoesNotTakeDownThePool) {
  WorkerPool pool;
  ASSERT_TRUE(pool.spawn("bad", []() { throw std::runtime_error("boom"); }));
  std::atomic<bool> ran{false};
  ASSERT_TRUE(pool.spawn("good", [&]() { ran.store(true); }));
  pool.shutdown();
  EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, RunningCountsUnfinishedJobs) {
  WorkerPool pool;
  std::atomic<bool> release{false};
  ASSERT_TRUE(pool.spawn("blocked", [&]() {
    while (!release.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }));
  EXPECT_EQ(pool.running(), 1u);
  release.store(true);
  pool.shutdown();
  EXPECT_EQ(pool.running(), 0u);
}
