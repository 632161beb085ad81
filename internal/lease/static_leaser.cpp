#include "static_leaser.hpp"

#include "internal/util/errors.hpp"

namespace walship::lease {

StaticLeaser::StaticLeaser(bool is_primary, Node self, Node primary)
    : is_primary_(is_primary), self_(std::move(self)), primary_(std::move(primary)) {
}

void StaticLeaser::Open() {
}

void StaticLeaser::Close() {
  held_ = false;
}

bool StaticLeaser::IsPrimary() const {
  return is_primary_ && held_;
}

Node StaticLeaser::Primary() {
  if (is_primary_) {
    return self_;
  }
  if (primary_.advertise_url.empty()) {
    throw util::NoPrimaryError("static primary has no advertise url");
  }
  return primary_;
}

Lease StaticLeaser::Acquire(const Node& candidate) {
  if (!is_primary_) {
    throw util::LeaseHeldError("static primary is " + primary_.hostname);
  }

  Lease lease;
  lease.id         = "static";
  lease.owner      = candidate;
  lease.term_start = util::Now();
  lease.ttl        = util::Duration::max();
  lease.lock_delay = util::Duration::zero();
  lease.expires_at = util::TimePoint::max();
  held_            = true;
  return lease;
}

Lease StaticLeaser::Renew(const Lease& lease) {
  if (!is_primary_ || lease.id != "static") {
    throw util::LeaseLostError("not the static primary");
  }
  return lease;
}

void StaticLeaser::Release(const Lease&) {
  held_ = false;
}

} // namespace walship::lease
