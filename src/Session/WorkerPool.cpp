#include "WorkerPool.hpp"

#include <exception>
#include <utility>

#include "logger.hpp"

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::spawn(const std::string& name, std::function<void()> job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopping_) {
    LOG(WARN) << "Worker pool stopping, rejected job " << name;
    return false;
  }
  reapLocked();

  auto done = std::make_shared<std::atomic<bool>>(false);
  Worker worker;
  worker.name = name;
  worker.done = done;
  worker.thread = std::thread([name, done, job = std::move(job)]() {
    try {
      job();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Worker " << name << " terminated by exception: "
                 << e.what();
    }
    done->store(true);
  });
  workers_.push_back(std::move(worker));
  return true;
}

void WorkerPool::shutdown() {
  std::list<Worker> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    pending.swap(workers_);
  }
  if (!pending.empty()) {
    LOG(INFO) << "Waiting for " << pending.size() << " worker(s) to exit";
  }
  for (auto& worker : pending) {
    if (worker.thread.joinable()) worker.thread.join();
  }
}

size_t WorkerPool::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& worker : workers_) {
    if (!worker.done->load()) ++count;
  }
  return count;
}

void WorkerPool::reapLocked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}
