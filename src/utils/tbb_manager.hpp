#ifndef TBB_MANAGER_HPP_
#define TBB_MANAGER_HPP_

#include <gflags/gflags.h>
#include <tbb/tbb.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "logger.hpp"

DECLARE_string(custom_tbb_parallel_control);

namespace utils {

struct TBBState {
  bool initialized = false;
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
};

/**
 * @brief 按名称管理 TBB arena，并发度由 --custom_tbb_parallel_control 控制
 *
 * 例如 "resolve:8" 让名为 resolve 的 arena 最多并行 8 个任务；
 * 未配置的 arena 使用 tbb::info::default_concurrency()。
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name);

  // 在指定 arena 中并行执行 task(i), i ∈ [start, end)。
  // 单个任务抛出的异常会被记录并计数，不会中断其它任务。
  // 返回抛出异常的任务数。
  template <typename IntType, typename Func>
  size_t ParallelFor(const std::string& tbb_name, IntType start, IntType end,
                     const Func& task);

  int Concurrency(const std::string& tbb_name);

  void Release();
  ~TBBManager();

  // 解析 "arena1:4,arena2:8"，格式错误时抛出 std::invalid_argument
  static std::map<std::string, int> ParseParallelCountDefines(
      const std::string& cfg);
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  uint64_t GenerateUniqueTaskId();

  std::unordered_map<std::string, TBBState> task_arenas_;
  std::atomic<uint64_t> next_task_id_{0};
  mutable std::mutex arenas_mutex_;
};

// 模板实现
template <typename IntType, typename Func>
size_t TBBManager::ParallelFor(const std::string& tbb_name, IntType start,
                               IntType end, const Func& task) {
  if (!(start < end)) return 0;

  std::string unique_task_name =
      tbb_name + "_" + std::to_string(GenerateUniqueTaskId());
  auto arena = Init(tbb_name);
  std::atomic<size_t> failures{0};

  LOG(DEBUG) << "[TBBManager] ParallelFor start: " << unique_task_name << " ["
             << start << "," << end << ")";
  arena->execute([&]() {
    tbb::parallel_for(tbb::blocked_range<IntType>(start, end, 1),
                      [&](const tbb::blocked_range<IntType>& range) {
                        for (IntType i = range.begin(); i < range.end(); ++i) {
                          try {
                            task(i);
                          } catch (const std::exception& e) {
                            failures.fetch_add(1);
                            LOG(ERROR) << "[TBBManager] Exception in task "
                                       << unique_task_name << "#" << i << ": "
                                       << e.what();
                          }
                        }
                      });
  });
  LOG(DEBUG) << "[TBBManager] ParallelFor end: " << unique_task_name;
  return failures.load();
}

}  // namespace utils

#endif  // TBB_MANAGER_HPP_
