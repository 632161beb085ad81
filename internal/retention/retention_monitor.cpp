#include "retention_monitor.hpp"

#include "internal/observability/logging.hpp"

namespace walship::retention {

using observability::IntField;
using observability::StringField;

RetentionMonitor::RetentionMonitor(std::shared_ptr<store::DatabaseRegistry> registry, store::RetentionPolicy policy, util::Duration interval)
    : registry_(std::move(registry)), policy_(policy), interval_(interval) {
}

RetentionMonitor::~RetentionMonitor() {
  Stop();
}

void RetentionMonitor::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RetentionMonitor::Run, this);
}

void RetentionMonitor::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
}

uint64_t RetentionMonitor::RunOnce(util::TimePoint now) {
  uint64_t total = 0;
  for (const auto& database : registry_->List()) {
    try {
      const auto pruned = database->Prune(policy_, now);
      if (pruned > 0) {
        WALSHIP_LOG_DEBUG("pruned frames", {StringField("database", database->Name()), IntField("frames", static_cast<int64_t>(pruned))});
      }
      total += pruned;
    } catch (const std::exception& e) {
      WALSHIP_LOG_WARN("retention pass failed", {StringField("database", database->Name()), StringField("error", e.what())});
    }
  }
  return total;
}

void RetentionMonitor::Run() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, interval_, [&] { return !running_.load(); });
      if (!running_) break;
    }
    RunOnce(util::Now());
  }
}

} // namespace walship::retention
