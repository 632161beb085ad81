#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "position.hpp"
#include "walship/core/v1/types.pb.h"

namespace walship::store {

struct RetentionPolicy {
  util::Duration duration{};   // zero = no wall-clock bound
  uint64_t       max_frames = 0; // zero = no frame-count bound
  // How long a disconnected session keeps pinning frames when duration is zero.
  util::Duration session_grace = std::chrono::minutes(10);

  util::Duration SessionWindow() const {
    return duration > util::Duration::zero() ? duration : session_grace;
  }
};

struct Snapshot {
  Position                       position;
  uint32_t                       page_count = 0;
  std::vector<db::model::PageRecord> pages;
};

/*
  One replicated database.

  Holds the position, the retained frame log, the materialised page image
  and the replication sessions reading it. Everything is guarded by one
  mutex; writers (Commit on a primary, ApplyFrame/ApplySnapshot on a
  replica) persist through the repository before touching memory.
*/
class Database {
 public:
  Database(std::string name, std::shared_ptr<db::Repository> repository);

  Database(const Database&)            = delete;
  Database& operator=(const Database&) = delete;

  const std::string& Name() const {
    return name_;
  }

  // Restores position, frame log and pages from the repository.
  void Load(const db::model::DatabaseRecord& record);

  Position CurrentPosition() const;

  // Primary: assigns txid, timestamp and (first time) the generation.
  Position Commit(walship::core::v1::Frame frame);

  // Primary, on promotion: moves an existing database to a fresh generation
  // at the same txid. The old generation's frames are dropped, so any node
  // still on the previous lineage fails its resume and resyncs.
  Position BeginGeneration();

  // Replica: returns false for an already applied frame. Throws DesyncError
  // on a gap or a generation change.
  bool ApplyFrame(const Position& position, const walship::core::v1::Frame& frame);

  // Replaces all local state with a primary snapshot.
  void ApplySnapshot(const Snapshot& snapshot);

  Snapshot GetSnapshot() const;

  // ------------------------------------------------------------------
  // Replication sessions (primary side)
  // ------------------------------------------------------------------

  // Throws PositionTooOldError if frames after `resume` are not retained.
  uint64_t OpenSession(const std::string& node_id, const Position& resume);

  // Blocks up to `timeout` for frames past the session cursor. Returns an
  // empty vector on timeout. Throws NotPrimaryError once the session is dropped.
  std::vector<walship::core::v1::Frame> WaitFrames(uint64_t session_id, util::Duration timeout, size_t max_frames, Position* current);

  void AdvanceSession(uint64_t session_id, const Position& cursor);
  void CloseSession(uint64_t session_id);

  // Records the position a replica reports as applied. Only the applied
  // position, never the send cursor, holds frames back from pruning.
  void Acknowledge(const std::string& node_id, const Position& applied);

  // Terminates every session; blocked WaitFrames calls throw NotPrimaryError.
  void DropSessions();

  // Removes frames outside the retention horizon that no live session needs.
  // Returns the number of frames removed.
  uint64_t Prune(const RetentionPolicy& policy, util::TimePoint now);

  walship::core::v1::DatabaseStatus Status() const;

 private:
  struct Session {
    uint64_t        id = 0;
    std::string     node_id;
    Position        cursor;
    Position        applied;
    bool            connected = true;
    util::TimePoint disconnected_at{};
    uint64_t        epoch = 0;
  };

  void PersistLocked(const walship::core::v1::Frame& frame, uint64_t generation, uint32_t page_count);
  void ApplyPagesLocked(const walship::core::v1::Frame& frame, uint32_t page_count);
  bool IsRetainedLocked(const Position& resume) const;

  const std::string               name_;
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  uint64_t                                 generation_ = 0;
  uint64_t                                 txid_       = 0;
  uint32_t                                 page_count_ = 0;
  std::deque<walship::core::v1::Frame>     log_;
  std::map<uint32_t, std::string>          pages_;
  std::map<uint64_t, Session>              sessions_;
  uint64_t                                 next_session_id_ = 1;
  uint64_t                                 epoch_           = 0;
};

} // namespace walship::store
