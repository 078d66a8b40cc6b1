#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace utils {

// 单线程定时器：一次性任务与周期任务在同一个后台线程上执行。
// 周期任务的回调如果超时，错过的轮次直接跳过，不会连续补跑。
class Timer {
 public:
  using Clock = std::chrono::steady_clock;

  Timer();
  ~Timer();

  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  void addOnceTask(std::chrono::milliseconds delay,
                   std::function<void()> callback);
  // period 为 0 时任务被拒绝
  bool addPeriodicTask(std::chrono::milliseconds delay,
                       std::chrono::milliseconds period,
                       std::function<void()> callback);
  void start();
  // 停止线程并丢弃尚未执行的任务
  void stop();
  size_t pendingTasks() const;

 private:
  struct Task {
    Clock::time_point due;
    std::chrono::milliseconds period;  // 0 表示一次性任务
    uint64_t seq;                      // 同一时刻按加入顺序执行
    std::function<void()> callback;
  };
  struct Later {
    bool operator()(const Task& a, const Task& b) const {
      return a.due != b.due ? a.due > b.due : a.seq > b.seq;
    }
  };

  void schedule(Clock::time_point due, std::chrono::milliseconds period,
                std::function<void()> callback);
  void loop();

  std::priority_queue<Task, std::vector<Task>, Later> tasks_;
  uint64_t nextSeq_;
  mutable std::mutex tasksMutex_;
  std::condition_variable tasksCv_;
  std::thread timerThread_;
  bool running_;
};

}  // namespace utils
