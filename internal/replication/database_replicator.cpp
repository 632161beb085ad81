#include "database_replicator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace walship::replication {

using observability::StringField;

DatabaseReplicator::DatabaseReplicator(std::shared_ptr<store::Database> database, std::shared_ptr<PrimaryClient> client, ReplicatorOptions options,
                                       std::shared_ptr<store::Invalidator> invalidator, AppliedFn on_applied)
    : database_(std::move(database)),
      client_(std::move(client)),
      options_(std::move(options)),
      invalidator_(std::move(invalidator)),
      on_applied_(std::move(on_applied)) {
}

DatabaseReplicator::~DatabaseReplicator() {
  Stop();
}

void DatabaseReplicator::Start() {
  running_ = true;
  thread_  = std::thread(&DatabaseReplicator::Run, this);
}

void DatabaseReplicator::Stop() {
  {
    std::lock_guard lock(sleep_mu_);
    running_ = false;
  }
  sleep_cv_.notify_all();

  {
    std::lock_guard lock(stream_mu_);
    if (stream_) stream_->Cancel();
  }

  if (thread_.joinable()) thread_.join();
}

void DatabaseReplicator::SleepFor(util::Duration d) {
  std::unique_lock lock(sleep_mu_);
  sleep_cv_.wait_for(lock, d, [&] { return !running_.load(); });
}

void DatabaseReplicator::Notify(const store::Position& position) {
  if (invalidator_) invalidator_->InvalidatePosition(database_->Name(), position);
  if (on_applied_) on_applied_(database_->Name(), position);
}

void DatabaseReplicator::Run() {
  util::Backoff backoff(options_.backoff_min, options_.backoff_max);

  while (running_) {
    bool resync = false;
    try {
      StreamOnce(backoff);
    } catch (const util::PositionTooOldError& e) {
      WALSHIP_LOG_WARN("resume position not retained by primary",
                       {StringField("database", database_->Name()), StringField("error", e.what())});
      resync = true;
    } catch (const util::DesyncError& e) {
      WALSHIP_LOG_WARN("replica out of sync with primary", {StringField("database", database_->Name()), StringField("error", e.what())});
      resync = true;
    } catch (const std::exception& e) {
      if (!running_) break;
      WALSHIP_LOG_WARN("replication stream failed", {StringField("database", database_->Name()), StringField("error", e.what())});
    }

    if (!running_) break;

    if (resync) {
      try {
        Resync();
        backoff.Reset();
        continue;
      } catch (const std::exception& e) {
        WALSHIP_LOG_WARN("resync failed", {StringField("database", database_->Name()), StringField("error", e.what())});
      }
    }

    SleepFor(backoff.Next());
  }
}

void DatabaseReplicator::StreamOnce(util::Backoff& backoff) {
  const auto resume = database_->CurrentPosition();
  auto       stream = client_->OpenStream(database_->Name(), resume, options_.node_id);
  {
    std::lock_guard lock(stream_mu_);
    stream_ = stream;
  }
  if (!running_) stream->Cancel();

  WALSHIP_LOG_DEBUG("replication stream opened", {StringField("database", database_->Name()), StringField("position", store::ToString(resume))});

  struct ClearStream {
    DatabaseReplicator* self;
    ~ClearStream() {
      std::lock_guard lock(self->stream_mu_);
      self->stream_.reset();
    }
  } clear{this};

  store::Position acked    = resume;
  auto            acked_at = std::chrono::steady_clock::now();
  auto            maybe_ack = [&] {
    const auto local = database_->CurrentPosition();
    const auto now   = std::chrono::steady_clock::now();
    if (local == acked || now - acked_at < options_.ack_interval) return;
    Acknowledge(local);
    acked    = local;
    acked_at = now;
  };

  walship::services::v1::StreamMessage msg;
  while (stream->Next(&msg)) {
    backoff.Reset();

    if (msg.has_frame()) {
      const auto position = store::FromProto(msg.frame().position());
      if (database_->ApplyFrame(position, msg.frame().frame())) {
        Notify(position);
      }
      maybe_ack();
      continue;
    }

    if (msg.has_heartbeat()) {
      const auto primary = store::FromProto(msg.heartbeat().position());
      const auto local   = database_->CurrentPosition();
      if (primary.generation != local.generation && !local.IsEmpty()) {
        throw util::DesyncError("primary generation " + store::ToString(primary) + " differs from local " + store::ToString(local));
      }
      if (primary.generation == local.generation && primary.txid < local.txid) {
        throw util::DesyncError("replica " + store::ToString(local) + " ahead of primary " + store::ToString(primary));
      }
      maybe_ack();
    }
  }
}

void DatabaseReplicator::Acknowledge(const store::Position& applied) {
  try {
    client_->Acknowledge(database_->Name(), applied, options_.node_id);
  } catch (const std::exception& e) {
    // the primary keeps the previous pin; the next ack catches up
    WALSHIP_LOG_DEBUG("acknowledge failed", {StringField("database", database_->Name()), StringField("error", e.what())});
  }
}

void DatabaseReplicator::Resync() {
  auto response = client_->Snapshot(database_->Name());

  store::Snapshot snapshot;
  snapshot.position   = store::FromProto(response.position());
  snapshot.page_count = response.page_count();
  snapshot.pages.reserve(response.pages_size());
  for (const auto& page : response.pages()) {
    snapshot.pages.push_back({page.pgno(), page.data()});
  }

  database_->ApplySnapshot(snapshot);
  observability::Metrics::Instance().RecordResync(database_->Name());
  WALSHIP_LOG_INFO("database resynced from snapshot",
                   {StringField("database", database_->Name()), StringField("position", store::ToString(snapshot.position))});

  Notify(snapshot.position);
}

} // namespace walship::replication
