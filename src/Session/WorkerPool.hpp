#ifndef WORKER_POOL_HPP_
#define WORKER_POOL_HPP_

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// One thread per submitted job, all owned by the pool. Finished threads are
// joined lazily on the next spawn(); shutdown() refuses new jobs and joins
// everything still running.
class WorkerPool {
 public:
  WorkerPool() = default;
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // False once shutdown() has started.
  bool spawn(const std::string& name, std::function<void()> job);

  void shutdown();

  size_t running() const;

 private:
  struct Worker {
    std::string name;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reapLocked();

  std::list<Worker> workers_;
  bool stopping_ = false;
  mutable std::mutex mutex_;
};

#endif  // WORKER_POOL_HPP_
