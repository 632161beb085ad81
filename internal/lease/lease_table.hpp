#pragma once

#include <functional>
#include <mutex>
#include <unordered_map>

#include "lease_backend.hpp"

namespace walship::lease {

/*
  In-process lease backend.

  Shared by every leaser of one process (tests, single-host deployments).
  The clock is injectable so lock-delay can be exercised deterministically.
*/
class LeaseTable final : public LeaseBackend {
 public:
  using NowFn = std::function<util::TimePoint()>;

  LeaseTable();
  explicit LeaseTable(NowFn now);

  void Open() override;
  void Close() override;

  Lease                TryAcquire(const std::string& key, const Node& owner, util::Duration ttl, util::Duration lock_delay) override;
  Lease                Renew(const std::string& key, const std::string& lease_id, util::Duration ttl) override;
  void                 Release(const std::string& key, const std::string& lease_id) override;
  std::optional<Lease> Current(const std::string& key) override;

  // While unavailable every call throws ConnectionError.
  void SetAvailable(bool available);

 private:
  void CheckAvailable() const;

  NowFn now_;

  mutable std::mutex                     mutex_;
  bool                                   available_ = true;
  std::unordered_map<std::string, Lease> leases_;
};

} // namespace walship::lease
