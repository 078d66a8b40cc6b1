#ifndef CANCELLATION_SIGNAL_HPP_
#define CANCELLATION_SIGNAL_HPP_

#include <atomic>

// One-shot cancellation flag shared between the registry and one worker.
// Raising it never blocks, whether or not anyone is still watching.
class CancellationSignal {
 public:
  CancellationSignal() = default;
  CancellationSignal(const CancellationSignal&) = delete;
  CancellationSignal& operator=(const CancellationSignal&) = delete;

  // True only for the call that actually raised the flag.
  bool signal() noexcept {
    bool expected = false;
    return raised_.compare_exchange_strong(expected, true,
                                           std::memory_order_acq_rel);
  }

  bool isSignalled() const noexcept {
    return raised_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> raised_{false};
};

#endif  // CANCELLATION_SIGNAL_HPP_
