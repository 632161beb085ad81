#include "coordinated_leaser.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace walship::lease {

using walship::observability::DurationField;
using walship::observability::StringField;

CoordinatedLeaser::CoordinatedLeaser(std::shared_ptr<LeaseBackend> backend, CoordinatedLeaserOptions options)
    : backend_(std::move(backend)), options_(std::move(options)) {
  if (!backend_) {
    throw util::InvalidArgument("lease backend required");
  }
  if (options_.ttl <= util::Duration::zero()) {
    throw util::InvalidArgument("lease ttl must be positive");
  }
}

void CoordinatedLeaser::Open() {
  backend_->Open();
  WALSHIP_LOG_INFO("lease backend opened",
                   {StringField("key", options_.key), DurationField("ttl", options_.ttl), DurationField("lock_delay", options_.lock_delay)});
}

void CoordinatedLeaser::Close() {
  {
    std::lock_guard lock(mutex_);
    held_.reset();
  }
  backend_->Close();
}

bool CoordinatedLeaser::IsPrimary() const {
  std::lock_guard lock(mutex_);
  return held_.has_value() && !held_->ExpiredAt(util::Now());
}

Node CoordinatedLeaser::Primary() {
  auto current = backend_->Current(options_.key);
  if (!current.has_value()) {
    throw util::NoPrimaryError("no primary holds " + options_.key);
  }
  return current->owner;
}

Lease CoordinatedLeaser::Acquire(const Node& candidate) {
  auto lease = backend_->TryAcquire(options_.key, candidate, options_.ttl, options_.lock_delay);

  std::lock_guard lock(mutex_);
  held_ = lease;
  return lease;
}

Lease CoordinatedLeaser::Renew(const Lease& lease) {
  try {
    auto renewed = backend_->Renew(options_.key, lease.id, options_.ttl);
    std::lock_guard lock(mutex_);
    held_ = renewed;
    return renewed;
  } catch (const util::LeaseLostError&) {
    std::lock_guard lock(mutex_);
    held_.reset();
    throw;
  }
}

void CoordinatedLeaser::Release(const Lease& lease) {
  {
    std::lock_guard lock(mutex_);
    held_.reset();
  }
  backend_->Release(options_.key, lease.id);
}

} // namespace walship::lease
