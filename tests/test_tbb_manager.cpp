#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "tbb_manager.hpp"

TEST(TBBManagerTest, ParsesArenaControl) {
  auto defines =
      utils::TBBManager::ParseParallelCountDefines("resolve:8,,io:2");
  ASSERT_EQ(defines.size(), 2u);
  EXPECT_EQ(defines["resolve"], 8);
  EXPECT_EQ(defines["io"], 2);
  EXPECT_TRUE(utils::TBBManager::ParseParallelCountDefines("").empty());
}

TEST(TBBManagerTest, RejectsMalformedArenaControl) {
  EXPECT_THROW(utils::TBBManager::ParseParallelCountDefines("resolve"),
               std::invalid_argument);
  EXPECT_THROW(utils::TBBManager::ParseParallelCountDefines(":4"),
               std::invalid_argument);
  EXPECT_THROW(utils::TBBManager::ParseParallelCountDefines("resolve:4x"),
               std::invalid_argument);
  EXPECT_THROW(utils::TBBManager::ParseParallelCountDefines("resolve:-1"),
               std::invalid_argument);
}

TEST(TBBManagerTest, ParallelForVisitsEveryIndex) {
  auto& manager = utils::TBBManager::GetInstance();
  std::vector<std::atomic<int>> visits(64);
  size_t failures = manager.ParallelFor(
      "test_visit", size_t(0), visits.size(),
      [&](size_t i) { visits[i].fetch_add(1); });
  EXPECT_EQ(failures, 0u);
  for (const auto& v : visits) EXPECT_EQ(v.load(), 1);
  EXPECT_GT(manager.Concurrency("test_visit"), 0);
}

TEST(TBBManagerTest, ParallelForCountsThrowingTasks) {
  auto& manager = utils::TBBManager::GetInstance();
  std::atomic<int> ran{0};
  size_t failures = manager.ParallelFor("test_throw", 0, 10, [&](int i) {
    ran.fetch_add(1);
    if (i % 3 == 0) throw std::runtime_error("bad index");
  });
  EXPECT_EQ(failures, 4u);
  EXPECT_EQ(ran.load(), 10);
}

TEST(TBBManagerTest, EmptyRangeDoesNothing) {
  int calls = 0;
  EXPECT_EQ(utils::TBBManager::GetInstance().ParallelFor(
                "test_empty", 5, 5, [&](int) { ++calls; }),
            0u);
  EXPECT_EQ(calls, 0);
}
