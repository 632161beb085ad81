#pragma once

#include <algorithm>
#include <chrono>

namespace walship::util {

// Exponential backoff: min, 2*min, 4*min ... capped at max.
class Backoff {
 public:
  Backoff(std::chrono::milliseconds min, std::chrono::milliseconds max) : min_(min), max_(std::max(min, max)), next_(min) {
  }

  std::chrono::milliseconds Next() {
    const auto current = next_;
    next_              = std::min(max_, next_ * 2);
    return current;
  }

  void Reset() {
    next_ = min_;
  }

 private:
  std::chrono::milliseconds min_;
  std::chrono::milliseconds max_;
  std::chrono::milliseconds next_;
};

} // namespace walship::util
