#pragma once

#include <optional>
#include <string>

#include "lease.hpp"

namespace walship::lease {

/*
  Storage for coordination-key leases.

  All time comparisons happen in the backend's clock. A key is acquirable
  only when now >= expires_at + lock_delay of the previous lease; release
  sets expires_at to now.
*/
class LeaseBackend {
 public:
  virtual ~LeaseBackend() = default;

  virtual void Open()  = 0;
  virtual void Close() = 0;

  // Throws LeaseHeldError while the key is held or inside its lock-delay window.
  virtual Lease TryAcquire(const std::string& key, const Node& owner, util::Duration ttl, util::Duration lock_delay) = 0;

  // Throws LeaseLostError unless lease_id is the current, unexpired lease.
  virtual Lease Renew(const std::string& key, const std::string& lease_id, util::Duration ttl) = 0;

  virtual void Release(const std::string& key, const std::string& lease_id) = 0;

  // Current unexpired lease, if any.
  virtual std::optional<Lease> Current(const std::string& key) = 0;
};

} // namespace walship::lease
