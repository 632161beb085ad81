#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/store/database.hpp"
#include "internal/store/invalidator.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/time.hpp"
#include "primary_client.hpp"

namespace walship::replication {

struct ReplicatorOptions {
  std::string    node_id;
  util::Duration backoff_min{100};
  util::Duration backoff_max{5000};
  // Minimum spacing of applied-position acknowledgements to the primary.
  util::Duration ack_interval{1000};
};

/*
  Replica-side worker for one database.

  Streams frames from the primary starting at the local position and applies
  them in order. PositionTooOldError and DesyncError fall back to a snapshot
  resync; every other failure reconnects with exponential backoff. The
  applied position is acknowledged back at most once per ack_interval.
*/
class DatabaseReplicator {
 public:
  using AppliedFn = std::function<void(const std::string& database, const store::Position& position)>;

  DatabaseReplicator(std::shared_ptr<store::Database> database, std::shared_ptr<PrimaryClient> client, ReplicatorOptions options,
                     std::shared_ptr<store::Invalidator> invalidator, AppliedFn on_applied);
  ~DatabaseReplicator();

  DatabaseReplicator(const DatabaseReplicator&)            = delete;
  DatabaseReplicator& operator=(const DatabaseReplicator&) = delete;

  void Start();
  void Stop();

 private:
  void Run();
  void StreamOnce(util::Backoff& backoff);
  void Resync();
  void Acknowledge(const store::Position& applied);
  void Notify(const store::Position& position);
  void SleepFor(util::Duration d);

  std::shared_ptr<store::Database>    database_;
  std::shared_ptr<PrimaryClient>      client_;
  ReplicatorOptions                   options_;
  std::shared_ptr<store::Invalidator> invalidator_;
  AppliedFn                           on_applied_;

  std::mutex                   stream_mu_;
  std::shared_ptr<FrameStream> stream_;

  std::mutex              sleep_mu_;
  std::condition_variable sleep_cv_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace walship::replication
