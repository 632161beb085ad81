#include "store.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/replication/database_replicator.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/errors.hpp"

namespace walship::store {

using observability::IntField;
using observability::StringField;

namespace {

walship::core::v1::Role ToProtoRole(Role role) {
  switch (role) {
    case Role::kInitializing:
      return walship::core::v1::ROLE_INITIALIZING;
    case Role::kPrimary:
      return walship::core::v1::ROLE_PRIMARY;
    case Role::kReplica:
      return walship::core::v1::ROLE_REPLICA;
    case Role::kDisconnected:
      return walship::core::v1::ROLE_DISCONNECTED;
  }
  return walship::core::v1::ROLE_UNSPECIFIED;
}

walship::core::v1::NodeInfo ToProtoNode(const lease::Node& node) {
  walship::core::v1::NodeInfo out;
  out.set_hostname(node.hostname);
  out.set_advertise_url(node.advertise_url);
  out.set_candidate(node.candidate);
  return out;
}

// Local view of when the lease runs out. `requested_at` is taken before the
// backend call, so the deadline never lands after the backend's.
util::TimePoint LocalDeadline(const lease::Lease& lease, util::TimePoint requested_at) {
  if (lease.Unbounded()) return util::TimePoint::max();
  return requested_at + lease.ttl;
}

} // namespace

std::string_view RoleName(Role role) {
  switch (role) {
    case Role::kInitializing:
      return "initializing";
    case Role::kPrimary:
      return "primary";
    case Role::kReplica:
      return "replica";
    case Role::kDisconnected:
      return "disconnected";
  }
  return "unknown";
}

Store::Store(StoreOptions options, std::shared_ptr<lease::Leaser> leaser, std::shared_ptr<DatabaseRegistry> registry,
             std::shared_ptr<replication::PrimaryClientFactory> clients)
    : options_(options), leaser_(std::move(leaser)), registry_(std::move(registry)), clients_(std::move(clients)) {
  if (!leaser_ || !registry_) {
    throw util::InvalidArgument("store requires a leaser and a registry");
  }
}

Store::~Store() {
  Close();
}

void Store::SetInvalidator(std::shared_ptr<Invalidator> invalidator) {
  invalidator_ = std::move(invalidator);
}

void Store::Open() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&Store::Monitor, this);
}

void Store::Close() {
  {
    std::lock_guard lock(sleep_mu_);
    if (!running_ && !thread_.joinable()) return;
    running_ = false;
  }
  sleep_cv_.notify_all();

  if (thread_.joinable()) thread_.join();

  try {
    leaser_->Close();
  } catch (const std::exception& e) {
    WALSHIP_LOG_WARN("leaser close failed", {StringField("error", e.what())});
  }
}

Role Store::CurrentRole() const {
  std::lock_guard lock(state_mu_);
  return role_;
}

bool Store::IsPrimary() const {
  std::lock_guard lock(state_mu_);
  return role_ == Role::kPrimary && util::Now() < lease_deadline_;
}

void Store::SetRole(Role role, std::optional<lease::Node> primary) {
  bool changed = false;
  {
    std::lock_guard lock(state_mu_);
    changed = role_ != role;
    role_   = role;
    if (primary) primary_ = *primary;
  }
  if (changed) {
    observability::Metrics::Instance().RecordRoleTransition(RoleName(role));
    WALSHIP_LOG_INFO("role changed", {StringField("role", RoleName(role))});
  }
}

bool Store::IsSelf(const lease::Node& node) const {
  const auto& self = leaser_->Self();
  return node.hostname == self.hostname && node.advertise_url == self.advertise_url;
}

void Store::SleepFor(util::Duration d) {
  std::unique_lock lock(sleep_mu_);
  sleep_cv_.wait_for(lock, d, [&] { return !running_.load(); });
}

void Store::CheckPrimaryLocked() const {
  std::lock_guard lock(state_mu_);
  if (role_ != Role::kPrimary) {
    throw util::NotPrimaryError(std::string("node is ") + std::string(RoleName(role_)));
  }
  if (util::Now() >= lease_deadline_) {
    throw util::NotPrimaryError("lease expired locally");
  }
}

void Store::CheckPrimary() const {
  std::shared_lock role(role_mu_);
  CheckPrimaryLocked();
}

Position Store::Commit(const std::string& database, walship::core::v1::Frame frame) {
  std::shared_lock role(role_mu_);
  CheckPrimaryLocked();
  return registry_->GetOrCreate(database)->Commit(std::move(frame));
}

Position Store::GetPosition(const std::string& database) const {
  auto db = registry_->Get(database);
  if (!db) {
    throw util::UnknownDatabaseError("unknown database " + database);
  }
  return db->CurrentPosition();
}

SessionHandle Store::OpenSession(const std::string& database, const std::string& node_id, const Position& resume) {
  std::shared_lock role(role_mu_);
  CheckPrimaryLocked();

  auto db = registry_->Get(database);
  if (!db) {
    throw util::UnknownDatabaseError("unknown database " + database);
  }
  return {db, db->OpenSession(node_id, resume)};
}

// ------------------------------------------------------------------
// Monitor
// ------------------------------------------------------------------

void Store::Monitor() {
  util::Backoff backoff(options_.backoff_min, options_.backoff_max);

  while (running_) {
    try {
      leaser_->Open();
      break;
    } catch (const util::ConnectionError& e) {
      SetRole(Role::kDisconnected);
      WALSHIP_LOG_WARN("lease backend unreachable", {StringField("error", e.what())});
      SleepFor(backoff.Next());
    }
  }
  backoff.Reset();

  while (running_) {
    try {
      if (options_.candidate) {
        try {
          const auto requested_at = util::Now();
          auto       lease        = leaser_->Acquire(leaser_->Self());
          backoff.Reset();
          MonitorAsPrimary(std::move(lease), requested_at);
          continue;
        } catch (const util::LeaseHeldError& e) {
          WALSHIP_LOG_DEBUG("lease held elsewhere", {StringField("reason", e.what())});
        }
      }

      lease::Node primary;
      try {
        primary = leaser_->Primary();
      } catch (const util::NoPrimaryError&) {
        SetRole(Role::kInitializing);
        SleepFor(options_.poll_interval);
        continue;
      }

      if (IsSelf(primary)) {
        // recorded as primary from an earlier term; wait for it to lapse
        SetRole(Role::kInitializing);
        SleepFor(options_.poll_interval);
        continue;
      }

      MonitorAsReplica(primary);
      if (running_) SleepFor(backoff.Next());
    } catch (const util::ConnectionError& e) {
      SetRole(Role::kDisconnected);
      WALSHIP_LOG_WARN("lease backend unreachable", {StringField("error", e.what())});
      SleepFor(backoff.Next());
    } catch (const std::exception& e) {
      WALSHIP_LOG_ERROR("election step failed", {StringField("error", e.what())});
      SleepFor(backoff.Next());
    }
  }
}

void Store::MonitorAsPrimary(lease::Lease lease, util::TimePoint acquired_at) {
  try {
    std::unique_lock role(role_mu_);
    BeginTerm();
    std::lock_guard lock(state_mu_);
    lease_deadline_ = LocalDeadline(lease, acquired_at);
  } catch (const std::exception&) {
    ReleaseLease(lease);
    throw;
  }
  SetRole(Role::kPrimary, leaser_->Self());
  WALSHIP_LOG_INFO("acquired primary lease", {StringField("lease_id", lease.id), StringField("node", leaser_->Self().hostname)});
  ready_.Fire();

  while (running_) {
    SleepFor(options_.renew_interval);
    if (!running_) break;

    try {
      const auto requested_at = util::Now();
      lease                   = leaser_->Renew(lease);
      std::lock_guard lock(state_mu_);
      lease_deadline_ = LocalDeadline(lease, requested_at);
    } catch (const util::LeaseLostError& e) {
      WALSHIP_LOG_WARN("primary lease lost", {StringField("error", e.what())});
      observability::Metrics::Instance().RecordLeaseLost();
      Demote("lease lost");
      return;
    } catch (const util::ConnectionError& e) {
      WALSHIP_LOG_WARN("lease renewal failed", {StringField("error", e.what())});
      bool expired = false;
      {
        std::lock_guard lock(state_mu_);
        expired = util::Now() >= lease_deadline_;
      }
      if (expired) {
        Demote("lease expired");
        return;
      }
    }
  }

  Demote("shutting down");
  ReleaseLease(lease);
}

void Store::ReleaseLease(const lease::Lease& lease) {
  try {
    leaser_->Release(lease);
  } catch (const std::exception& e) {
    WALSHIP_LOG_WARN("lease release failed", {StringField("error", e.what())});
  }
}

// Every database moves to a fresh generation before the first commit of the
// term, so a former primary's unreplicated frames can never be resumed onto.
void Store::BeginTerm() {
  for (const auto& db : registry_->List()) {
    const auto position = db->BeginGeneration();
    if (position.IsEmpty()) continue;
    WALSHIP_LOG_INFO("started generation", {StringField("database", db->Name()), StringField("position", ToString(position))});
  }
}

void Store::Demote(std::string_view reason) {
  {
    std::unique_lock role(role_mu_);
    {
      std::lock_guard lock(state_mu_);
      lease_deadline_ = {};
    }
    SetRole(Role::kInitializing);
    registry_->DropSessions();
  }
  WALSHIP_LOG_INFO("stepped down as primary", {StringField("reason", reason)});
}

void Store::MonitorAsReplica(const lease::Node& primary) {
  if (!clients_) {
    throw util::InvalidArgument("replica mode requires a primary client factory");
  }

  std::shared_ptr<replication::PrimaryClient> client;
  walship::services::v1::GetPrimaryStateResponse state;
  try {
    client = clients_->Connect(primary.advertise_url);
    state  = client->GetPrimaryState();
  } catch (const std::exception& e) {
    WALSHIP_LOG_WARN("cannot reach primary", {StringField("primary", primary.advertise_url), StringField("error", e.what())});
    return;
  }

  SetRole(Role::kReplica, primary);
  WALSHIP_LOG_INFO("replicating from primary",
                   {StringField("primary", primary.hostname), StringField("url", primary.advertise_url), IntField("databases", state.databases_size())});

  {
    std::lock_guard lock(ready_mu_);
    ready_targets_.clear();
    for (const auto& db : state.databases()) {
      ready_targets_[db.name()] = FromProto(db.position());
    }
  }

  replication::ReplicatorOptions replicator_options;
  replicator_options.node_id     = leaser_->Self().hostname;
  replicator_options.backoff_min = options_.backoff_min;
  replicator_options.backoff_max = options_.backoff_max;

  std::map<std::string, std::unique_ptr<replication::DatabaseReplicator>> replicators;
  auto start = [&](const std::string& name) {
    if (replicators.count(name)) return;
    auto replicator = std::make_unique<replication::DatabaseReplicator>(registry_->GetOrCreate(name), client, replicator_options, invalidator_,
                                                                        [this](const std::string&, const Position&) { CheckReady(); });
    replicator->Start();
    replicators.emplace(name, std::move(replicator));
  };

  for (const auto& db : state.databases()) {
    start(db.name());
  }
  CheckReady();

  while (running_) {
    SleepFor(options_.poll_interval);
    if (!running_) break;

    try {
      auto current = leaser_->Primary();
      if (current.advertise_url != primary.advertise_url) {
        WALSHIP_LOG_INFO("primary changed", {StringField("from", primary.advertise_url), StringField("to", current.advertise_url)});
        break;
      }
    } catch (const util::NoPrimaryError&) {
      WALSHIP_LOG_INFO("primary lease lapsed", {StringField("primary", primary.hostname)});
      break;
    } catch (const util::ConnectionError& e) {
      WALSHIP_LOG_WARN("lease backend unreachable", {StringField("error", e.what())});
      SetRole(Role::kDisconnected);
      break;
    }

    try {
      state = client->GetPrimaryState();
      for (const auto& db : state.databases()) {
        start(db.name());
      }
    } catch (const std::exception& e) {
      WALSHIP_LOG_DEBUG("primary state refresh failed", {StringField("error", e.what())});
    }
    CheckReady();
  }

  for (auto& [_, replicator] : replicators) {
    replicator->Stop();
  }
  if (CurrentRole() == Role::kReplica) {
    SetRole(Role::kInitializing);
  }
}

void Store::CheckReady() {
  if (ready_.IsFired()) return;

  std::lock_guard lock(ready_mu_);
  for (const auto& [name, target] : ready_targets_) {
    if (target.IsEmpty()) continue;

    auto db = registry_->Get(name);
    if (!db) return;

    const auto local = db->CurrentPosition();
    if (local.generation != target.generation || local.txid < target.txid) return;
  }

  if (ready_.Fire()) {
    WALSHIP_LOG_INFO("replica caught up with primary");
  }
}

// ------------------------------------------------------------------
// Status
// ------------------------------------------------------------------

walship::core::v1::StoreStatus Store::Status() const {
  walship::core::v1::StoreStatus status;
  {
    std::lock_guard lock(state_mu_);
    status.set_role(ToProtoRole(role_));
    if (role_ == Role::kPrimary || role_ == Role::kReplica) {
      *status.mutable_primary() = ToProtoNode(primary_);
    }
  }
  *status.mutable_node() = ToProtoNode(leaser_->Self());
  status.set_ready(ready_.IsFired());

  for (const auto& db : registry_->List()) {
    *status.add_databases() = db->Status();
  }
  return status;
}

std::string Store::StatusJson() const {
  std::string json;
  auto        result = google::protobuf::util::MessageToJsonString(Status(), &json);
  if (!result.ok()) {
    throw std::runtime_error("store status: " + std::string(result.message()));
  }
  return json;
}

} // namespace walship::store
