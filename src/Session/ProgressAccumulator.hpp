#ifndef PROGRESS_ACCUMULATOR_HPP_
#define PROGRESS_ACCUMULATOR_HPP_

#include <cstdint>

// Byte counter of one session. Not synchronized: lives inside the
// SessionRegistry and is only touched under the registry lock.
class ProgressAccumulator {
 public:
  enum class AdvanceResult { Ok, ExceedsTotal };

  // Adds n bytes. Before setTotal() bytes simply accumulate; afterwards a
  // step past the total is refused and leaves the counter unchanged.
  AdvanceResult advance(uint64_t n);

  // Returns false if the total was already set or is below the bytes
  // already counted.
  bool setTotal(uint64_t total);

  uint64_t downloadedBytes() const { return downloaded_; }
  uint64_t totalBytes() const { return total_; }
  bool totalKnown() const { return totalSet_; }

  // floor(downloaded / total * 100); 0 while the total is 0.
  uint32_t percentage() const;

  // Resolved with a zero total: nothing to transfer, complete at 100%.
  bool emptyResource() const { return totalSet_ && total_ == 0; }

 private:
  uint64_t downloaded_ = 0;
  uint64_t total_ = 0;
  bool totalSet_ = false;
};

#endif  // PROGRESS_ACCUMULATOR_HPP_
