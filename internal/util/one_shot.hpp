#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace walship::util {

/*
  Write-once, broadcast-read notification.

  Fire() may be called any number of times; only the first call has an effect.
*/
class OneShotSignal {
 public:
  // Returns true if this call fired the signal.
  bool Fire() {
    {
      std::lock_guard lock(mutex_);
      if (fired_) return false;
      fired_ = true;
    }
    cv_.notify_all();
    return true;
  }

  bool IsFired() const {
    std::lock_guard lock(mutex_);
    return fired_;
  }

  void Wait() const {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return fired_; });
  }

  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return fired_; });
  }

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            fired_ = false;
};

} // namespace walship::util
