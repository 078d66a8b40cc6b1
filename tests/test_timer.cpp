#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "timer.hpp"

using namespace std::chrono_literals;

namespace {
bool waitFor(const std::atomic<int>& counter, int target) {
  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (counter.load() < target) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(1ms);
  }
  return true;
}
}  // namespace

TEST(TimerTest, RunsOnceTask) {
  utils::Timer timer;
  std::atomic<int> fired{0};
  timer.addOnceTask(10ms, [&]() { fired.fetch_add(1); });
  timer.start();
  ASSERT_TRUE(waitFor(fired, 1));
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(fired.load(), 1);
  EXPECT_EQ(timer.pendingTasks(), 0u);
  timer.stop();
}

TEST(TimerTest, RepeatsPeriodicTask) {
  utils::Timer timer;
  std::atomic<int> fired{0};
  ASSERT_TRUE(timer.addPeriodicTask(0ms, 5ms, [&]() { fired.fetch_add(1); }));
  timer.start();
  EXPECT_TRUE(waitFor(fired, 3));
  timer.stop();
  EXPECT_EQ(timer.pendingTasks(), 0u);
}

TEST(TimerTest, RejectsZeroPeriod) {
  utils::Timer timer;
  EXPECT_FALSE(timer.addPeriodicTask(0ms, 0ms, []() {}));
  EXPECT_EQ(timer.pendingTasks(), 0u);
}

TEST(TimerTest, ThrowingTaskKeepsTimerAlive) {
  utils::Timer timer;
  std::atomic<int> fired{0};
  timer.addOnceTask(0ms, []() { throw std::runtime_error("boom"); });
  timer.addOnceTask(5ms, [&]() { fired.fetch_add(1); });
  timer.start();
  EXPECT_TRUE(waitFor(fired, 1));
}

TEST(TimerTest, StopDropsPendingTasks) {
  utils::Timer timer;
  std::atomic<int> fired{0};
  timer.addOnceTask(10s, [&]() { fired.fetch_add(1); });
  timer.start();
  timer.stop();
  EXPECT_EQ(fired.load(), 0);
  EXPECT_EQ(timer.pendingTasks(), 0u);
}
