#include "timer.hpp"

#include <exception>
#include <utility>

#include "logger.hpp"

namespace utils {

Timer::Timer() : nextSeq_(0), running_(false) {}
Timer::~Timer() { stop(); }

void Timer::schedule(Clock::time_point due, std::chrono::milliseconds period,
                     std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  tasks_.push(Task{due, period, nextSeq_++, std::move(callback)});
  tasksCv_.notify_one();
}

void Timer::addOnceTask(std::chrono::milliseconds delay,
                        std::function<void()> callback) {
  schedule(Clock::now() + delay, std::chrono::milliseconds(0),
           std::move(callback));
}

bool Timer::addPeriodicTask(std::chrono::milliseconds delay,
                            std::chrono::milliseconds period,
                            std::function<void()> callback) {
  if (period.count() <= 0) {
    LOG(WARN) << "Timer: periodic task with period " << period.count()
              << "ms rejected";
    return false;
  }
  schedule(Clock::now() + delay, period, std::move(callback));
  return true;
}

void Timer::start() {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  if (running_) return;
  running_ = true;
  timerThread_ = std::thread([this]() { loop(); });
}

void Timer::loop() {
  std::unique_lock<std::mutex> lock(tasksMutex_);
  while (running_) {
    if (tasks_.empty()) {
      tasksCv_.wait(lock, [this]() { return !tasks_.empty() || !running_; });
      continue;
    }
    if (tasks_.top().due > Clock::now()) {
      // 新任务插到队首或 stop() 时会提前唤醒
      Clock::time_point due = tasks_.top().due;
      tasksCv_.wait_until(lock, due, [this, due]() {
        return !running_ || tasks_.top().due < due;
      });
      continue;
    }

    Task task = tasks_.top();
    tasks_.pop();
    if (task.period.count() > 0) {
      Task next = task;
      next.due += next.period;
      Clock::time_point now = Clock::now();
      while (next.due <= now) next.due += next.period;
      next.seq = nextSeq_++;
      tasks_.push(std::move(next));
    }

    lock.unlock();  // 回调执行期间不持锁
    try {
      task.callback();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Timer task threw: " << e.what();
    }
    lock.lock();
  }
}

void Timer::stop() {
  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    running_ = false;
    tasks_ = decltype(tasks_)();
    tasksCv_.notify_all();
  }
  if (timerThread_.joinable()) {
    timerThread_.join();
  }
}

size_t Timer::pendingTasks() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  return tasks_.size();
}

}  // namespace utils
