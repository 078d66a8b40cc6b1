#include "ProgressAccumulator.hpp"

#include <limits>

ProgressAccumulator::AdvanceResult ProgressAccumulator::advance(uint64_t n) {
  if (totalSet_) {
    if (n > total_ - downloaded_) return AdvanceResult::ExceedsTotal;
  } else if (n > std::numeric_limits<uint64_t>::max() - downloaded_) {
    return AdvanceResult::ExceedsTotal;
  }
  downloaded_ += n;
  return AdvanceResult::Ok;
}

bool ProgressAccumulator::setTotal(uint64_t total) {
  if (totalSet_ || total < downloaded_) return false;
  total_ = total;
  totalSet_ = true;
  return true;
}

uint32_t ProgressAccumulator::percentage() const {
  if (total_ == 0) return 0;
  if (downloaded_ >= total_) return 100;
  // downloaded_ < total_ here, so only the multiplication can overflow
  if (downloaded_ <= std::numeric_limits<uint64_t>::max() / 100) {
    return static_cast<uint32_t>(downloaded_ * 100 / total_);
  }
  return static_cast<uint32_t>(downloaded_ / (total_ / 100));
}
