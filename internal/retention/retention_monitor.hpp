#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/store/database.hpp"
#include "internal/store/database_registry.hpp"
#include "internal/util/time.hpp"

namespace walship::retention {

/*
  Background worker bounding the retained frame log.

  Every `interval` each database drops the frames outside the retention
  horizon that no live replication session still needs.
*/
class RetentionMonitor {
 public:
  RetentionMonitor(std::shared_ptr<store::DatabaseRegistry> registry, store::RetentionPolicy policy, util::Duration interval);
  ~RetentionMonitor();

  void Start();
  void Stop();

  // One pass over every database. Returns the number of frames removed.
  uint64_t RunOnce(util::TimePoint now);

 private:
  void Run();

  std::shared_ptr<store::DatabaseRegistry> registry_;
  store::RetentionPolicy                   policy_;
  util::Duration                           interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace walship::retention
