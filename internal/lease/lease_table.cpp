#include "lease_table.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace walship::lease {

LeaseTable::LeaseTable() : LeaseTable(&util::Now) {
}

LeaseTable::LeaseTable(NowFn now) : now_(std::move(now)) {
}

void LeaseTable::Open() {
  CheckAvailable();
}

void LeaseTable::Close() {
}

void LeaseTable::SetAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
}

void LeaseTable::CheckAvailable() const {
  if (!available_) {
    throw util::ConnectionError("lease table unavailable");
  }
}

Lease LeaseTable::TryAcquire(const std::string& key, const Node& owner, util::Duration ttl, util::Duration lock_delay) {
  std::lock_guard lock(mutex_);
  CheckAvailable();

  const auto now = now_();
  if (auto it = leases_.find(key); it != leases_.end()) {
    const auto& existing = it->second;
    if (now < existing.expires_at) {
      throw util::LeaseHeldError("lease held by " + existing.owner.hostname);
    }
    if (now < existing.expires_at + existing.lock_delay) {
      throw util::LeaseHeldError("lease lock-delay in effect after " + existing.owner.hostname);
    }
  }

  Lease lease;
  lease.id         = util::NewLeaseId();
  lease.owner      = owner;
  lease.term_start = now;
  lease.ttl        = ttl;
  lease.lock_delay = lock_delay;
  lease.expires_at = now + ttl;

  leases_[key] = lease;
  return lease;
}

Lease LeaseTable::Renew(const std::string& key, const std::string& lease_id, util::Duration ttl) {
  std::lock_guard lock(mutex_);
  CheckAvailable();

  const auto now = now_();
  auto       it  = leases_.find(key);
  if (it == leases_.end() || it->second.id != lease_id) {
    throw util::LeaseLostError("lease no longer held");
  }
  if (it->second.ExpiredAt(now)) {
    throw util::LeaseLostError("lease expired");
  }

  it->second.ttl        = ttl;
  it->second.expires_at = now + ttl;
  return it->second;
}

void LeaseTable::Release(const std::string& key, const std::string& lease_id) {
  std::lock_guard lock(mutex_);
  CheckAvailable();

  const auto now = now_();
  auto       it  = leases_.find(key);
  if (it == leases_.end() || it->second.id != lease_id || it->second.ExpiredAt(now)) {
    return;
  }
  it->second.expires_at = now;
}

std::optional<Lease> LeaseTable::Current(const std::string& key) {
  std::lock_guard lock(mutex_);
  CheckAvailable();

  auto it = leases_.find(key);
  if (it == leases_.end() || it->second.ExpiredAt(now_())) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace walship::lease
