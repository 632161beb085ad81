#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>

#include "database_registry.hpp"
#include "internal/lease/leaser.hpp"
#include "internal/replication/primary_client.hpp"
#include "internal/util/one_shot.hpp"
#include "internal/util/time.hpp"
#include "invalidator.hpp"
#include "walship/core/v1/types.pb.h"

namespace walship::store {

enum class Role {
  kInitializing,
  kPrimary,
  kReplica,
  kDisconnected,
};

std::string_view RoleName(Role role);

struct StoreOptions {
  bool           candidate = true;
  util::Duration renew_interval{5000};
  util::Duration poll_interval{1000};
  util::Duration backoff_min{100};
  util::Duration backoff_max{5000};
};

// An open replication session on a primary database.
struct SessionHandle {
  std::shared_ptr<Database> database;
  uint64_t                  id = 0;
};

/*
  Election state machine.

  A monitor thread drives the leaser:
      Initializing -> Primary  on Acquire
      Initializing -> Replica  when another node holds the lease
      Primary      -> Initializing on LeaseLostError or local lease expiry
      any          -> Disconnected on backend ConnectionError

  Commit admission and session registration take role_mu_ shared; demotion
  takes it exclusive, so nothing is admitted once demotion has started.
*/
class Store {
 public:
  Store(StoreOptions options, std::shared_ptr<lease::Leaser> leaser, std::shared_ptr<DatabaseRegistry> registry,
        std::shared_ptr<replication::PrimaryClientFactory> clients);
  ~Store();

  Store(const Store&)            = delete;
  Store& operator=(const Store&) = delete;

  // Must be called before Open().
  void SetInvalidator(std::shared_ptr<Invalidator> invalidator);

  void Open();
  void Close();

  Role CurrentRole() const;
  bool IsPrimary() const;

  // Fires once as primary, or once a replica caught up with the primary
  // positions observed at connect time.
  const util::OneShotSignal& Ready() const {
    return ready_;
  }

  // Throws NotPrimaryError unless this node holds an unexpired lease.
  Position Commit(const std::string& database, walship::core::v1::Frame frame);

  // Throws UnknownDatabaseError.
  Position GetPosition(const std::string& database) const;

  // Throws NotPrimaryError, UnknownDatabaseError or PositionTooOldError.
  SessionHandle OpenSession(const std::string& database, const std::string& node_id, const Position& resume);

  // Throws NotPrimaryError.
  void CheckPrimary() const;

  const lease::Node& Self() const {
    return leaser_->Self();
  }

  std::shared_ptr<DatabaseRegistry> Registry() const {
    return registry_;
  }

  walship::core::v1::StoreStatus Status() const;
  std::string                    StatusJson() const;

 private:
  void Monitor();
  void MonitorAsPrimary(lease::Lease lease, util::TimePoint acquired_at);
  void BeginTerm();
  void ReleaseLease(const lease::Lease& lease);
  void MonitorAsReplica(const lease::Node& primary);
  void Demote(std::string_view reason);
  void SetRole(Role role, std::optional<lease::Node> primary = std::nullopt);
  void CheckPrimaryLocked() const;
  void CheckReady();
  void SleepFor(util::Duration d);
  bool IsSelf(const lease::Node& node) const;

  StoreOptions                                       options_;
  std::shared_ptr<lease::Leaser>                     leaser_;
  std::shared_ptr<DatabaseRegistry>                  registry_;
  std::shared_ptr<replication::PrimaryClientFactory> clients_;
  std::shared_ptr<Invalidator>                       invalidator_;

  mutable std::shared_mutex role_mu_;

  mutable std::mutex state_mu_;
  Role               role_ = Role::kInitializing;
  lease::Node        primary_;
  util::TimePoint    lease_deadline_{};

  std::mutex                      ready_mu_;
  std::map<std::string, Position> ready_targets_;
  util::OneShotSignal             ready_;

  std::mutex              sleep_mu_;
  std::condition_variable sleep_cv_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace walship::store
