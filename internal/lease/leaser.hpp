#pragma once

#include "lease.hpp"

namespace walship::lease {

/*
  Elects one primary among candidate nodes.

  Errors (internal/util/errors.hpp):
    ConnectionError  backend unreachable
    NoPrimaryError   Primary() when nobody holds the lease
    LeaseHeldError   Acquire() while another lease or the lock-delay window is open
    LeaseLostError   Renew() after the backend dropped the lease
*/
class Leaser {
 public:
  virtual ~Leaser() = default;

  virtual void Open()  = 0;
  virtual void Close() = 0;

  // The local node as configured.
  virtual const Node& Self() const = 0;

  // True while this process holds an unexpired lease.
  virtual bool IsPrimary() const = 0;

  virtual Node Primary() = 0;

  virtual Lease Acquire(const Node& candidate) = 0;
  virtual Lease Renew(const Lease& lease)      = 0;

  // Best effort.
  virtual void Release(const Lease& lease) = 0;
};

} // namespace walship::lease
