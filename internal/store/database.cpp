#include "database.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace walship::store {

using walship::core::v1::Frame;

namespace {

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (!result) {
    throw std::runtime_error(prefix + " (" + std::string(db::ErrorCodeName(result.code)) + "): " + result.message);
  }
}

} // namespace

Database::Database(std::string name, std::shared_ptr<db::Repository> repository) : name_(std::move(name)), repository_(std::move(repository)) {
}

void Database::Load(const db::model::DatabaseRecord& record) {
  auto tx     = repository_->Begin();
  auto frames = repository_->ReadFrames(*tx, name_);
  auto pages  = repository_->ReadPages(*tx, name_);
  tx->Commit();

  std::lock_guard lock(mutex_);
  generation_ = record.generation;
  txid_       = record.txid;
  page_count_ = record.page_count;

  log_.clear();
  for (const auto& frame_record : frames) {
    Frame frame;
    if (!frame.ParseFromString(frame_record.data)) {
      throw std::runtime_error("corrupt frame " + std::to_string(frame_record.txid) + " in " + name_);
    }
    log_.push_back(std::move(frame));
  }

  pages_.clear();
  for (auto& page : pages) {
    pages_[page.pgno] = std::move(page.data);
  }
}

Position Database::CurrentPosition() const {
  std::lock_guard lock(mutex_);
  return {generation_, txid_};
}

void Database::PersistLocked(const Frame& frame, uint64_t generation, uint32_t page_count) {
  db::model::FrameRecord record;
  record.database     = name_;
  record.generation   = generation;
  record.txid         = frame.txid();
  record.timestamp_ms = frame.timestamp_ms();
  record.data         = frame.SerializeAsString();

  std::vector<db::model::PageRecord> pages;
  pages.reserve(frame.pages_size());
  for (const auto& page : frame.pages()) {
    pages.push_back({page.pgno(), page.data()});
  }

  auto tx = repository_->Begin();
  ThrowIfError(repository_->AppendFrame(*tx, record), "append frame");
  ThrowIfError(repository_->WritePages(*tx, name_, pages, page_count), "write pages");
  ThrowIfError(repository_->UpsertDatabase(*tx, {name_, generation, frame.txid(), page_count}), "update database");
  tx->Commit();
}

void Database::ApplyPagesLocked(const Frame& frame, uint32_t page_count) {
  for (const auto& page : frame.pages()) {
    pages_[page.pgno()] = page.data();
  }
  pages_.erase(pages_.upper_bound(page_count), pages_.end());
  page_count_ = page_count;
}

Position Database::Commit(Frame frame) {
  if (frame.pages().empty()) {
    throw util::InvalidArgument("frame for " + name_ + " has no pages");
  }

  uint32_t max_pgno = 0;
  for (const auto& page : frame.pages()) {
    if (page.pgno() == 0) {
      throw util::InvalidArgument("page numbers start at 1");
    }
    max_pgno = std::max(max_pgno, page.pgno());
  }

  Position committed;
  {
    std::lock_guard lock(mutex_);

    const uint32_t page_count = frame.commit() != 0 ? frame.commit() : std::max(page_count_, max_pgno);
    if (page_count < max_pgno) {
      throw util::InvalidArgument("commit page count " + std::to_string(page_count) + " below written page " + std::to_string(max_pgno));
    }

    const uint64_t generation = generation_ != 0 ? generation_ : util::NewGeneration();
    frame.set_txid(txid_ + 1);
    frame.set_commit(page_count);
    frame.set_timestamp_ms(static_cast<int64_t>(util::ToUnixMillis(util::Now())));

    PersistLocked(frame, generation, page_count);

    generation_ = generation;
    txid_       = frame.txid();
    ApplyPagesLocked(frame, page_count);
    log_.push_back(std::move(frame));
    committed = {generation_, txid_};
  }
  cv_.notify_all();

  observability::Metrics::Instance().RecordCommit(name_);
  return committed;
}

Position Database::BeginGeneration() {
  Position started;
  {
    std::lock_guard lock(mutex_);
    if (generation_ == 0) return {};

    const uint64_t generation = util::NewGeneration();

    auto tx = repository_->Begin();
    ThrowIfError(repository_->DeleteAllFrames(*tx, name_), "delete frames");
    ThrowIfError(repository_->UpsertDatabase(*tx, {name_, generation, txid_, page_count_}), "update database");
    tx->Commit();

    generation_ = generation;
    log_.clear();
    ++epoch_;
    sessions_.clear();
    started = {generation_, txid_};
  }
  cv_.notify_all();
  return started;
}

bool Database::ApplyFrame(const Position& position, const Frame& frame) {
  {
    std::lock_guard lock(mutex_);

    if (position.generation == 0 || position.txid != frame.txid()) {
      throw util::DesyncError("malformed frame position " + ToString(position) + " for " + name_);
    }
    if (generation_ != 0 && position.generation != generation_) {
      throw util::DesyncError("generation changed for " + name_ + ": local " + ToString({generation_, txid_}) + ", primary " + ToString(position));
    }
    if (frame.txid() <= txid_) {
      return false;
    }
    if (frame.txid() != txid_ + 1) {
      throw util::DesyncError("gap in " + name_ + ": applied " + std::to_string(txid_) + ", received " + std::to_string(frame.txid()));
    }

    uint32_t page_count = frame.commit();
    for (const auto& page : frame.pages()) {
      page_count = std::max(page_count, page.pgno());
    }

    PersistLocked(frame, position.generation, page_count);

    generation_ = position.generation;
    txid_       = frame.txid();
    ApplyPagesLocked(frame, page_count);
    log_.push_back(frame);
  }
  cv_.notify_all();

  observability::Metrics::Instance().RecordFramesApplied(name_, 1);
  return true;
}

void Database::ApplySnapshot(const Snapshot& snapshot) {
  {
    std::lock_guard lock(mutex_);

    auto tx = repository_->Begin();
    ThrowIfError(repository_->ReplacePages(*tx, name_, snapshot.pages), "replace pages");
    ThrowIfError(repository_->DeleteAllFrames(*tx, name_), "delete frames");
    ThrowIfError(repository_->UpsertDatabase(*tx, {name_, snapshot.position.generation, snapshot.position.txid, snapshot.page_count}), "update database");
    tx->Commit();

    generation_ = snapshot.position.generation;
    txid_       = snapshot.position.txid;
    page_count_ = snapshot.page_count;
    log_.clear();
    pages_.clear();
    for (const auto& page : snapshot.pages) {
      pages_[page.pgno] = page.data;
    }
  }
  cv_.notify_all();
}

Snapshot Database::GetSnapshot() const {
  std::lock_guard lock(mutex_);

  Snapshot out;
  out.position   = {generation_, txid_};
  out.page_count = page_count_;
  out.pages.reserve(pages_.size());
  for (const auto& [pgno, data] : pages_) {
    out.pages.push_back({pgno, data});
  }
  return out;
}

bool Database::IsRetainedLocked(const Position& resume) const {
  if (!resume.IsEmpty() && resume.generation != generation_) return false;
  if (resume.txid == txid_) return true;
  if (resume.txid > txid_) return false;
  return !log_.empty() && log_.front().txid() <= resume.txid + 1;
}

uint64_t Database::OpenSession(const std::string& node_id, const Position& resume) {
  std::lock_guard lock(mutex_);

  if (!IsRetainedLocked(resume)) {
    throw util::PositionTooOldError("position " + ToString(resume) + " no longer retained for " + name_ + " (current " +
                                    ToString({generation_, txid_}) + ")");
  }

  // a reconnecting replica replaces its own disconnected session
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (!it->second.connected && it->second.node_id == node_id) {
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }

  Session session;
  session.id     = next_session_id_++;
  session.node_id = node_id;
  session.cursor  = {generation_, resume.txid};
  session.applied = session.cursor;
  session.epoch   = epoch_;
  sessions_.emplace(session.id, session);
  return session.id;
}

std::vector<Frame> Database::WaitFrames(uint64_t session_id, util::Duration timeout, size_t max_frames, Position* current) {
  std::unique_lock lock(mutex_);

  auto live = [&]() -> Session* {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.epoch != epoch_) return nullptr;
    return &it->second;
  };

  cv_.wait_for(lock, timeout, [&] {
    auto* session = live();
    return session == nullptr || txid_ > session->cursor.txid;
  });

  auto* session = live();
  if (session == nullptr) {
    throw util::NotPrimaryError("replication session for " + name_ + " dropped");
  }

  if (current) *current = {generation_, txid_};

  std::vector<Frame> out;
  if (txid_ <= session->cursor.txid) {
    return out;
  }

  const uint64_t next = session->cursor.txid + 1;
  if (log_.empty() || log_.front().txid() > next) {
    throw util::PositionTooOldError("frame " + std::to_string(next) + " of " + name_ + " no longer retained");
  }

  const size_t limit = max_frames == 0 ? std::numeric_limits<size_t>::max() : max_frames;
  for (auto it = log_.begin() + static_cast<std::ptrdiff_t>(next - log_.front().txid()); it != log_.end() && out.size() < limit; ++it) {
    out.push_back(*it);
  }
  return out;
}

void Database::AdvanceSession(uint64_t session_id, const Position& cursor) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    it->second.cursor = cursor;
  }
}

void Database::CloseSession(uint64_t session_id) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    it->second.connected       = false;
    it->second.disconnected_at = util::Now();
  }
}

void Database::Acknowledge(const std::string& node_id, const Position& applied) {
  std::lock_guard lock(mutex_);
  if (applied.generation != generation_ || applied.txid > txid_) return;

  for (auto& [_, session] : sessions_) {
    if (session.node_id == node_id && session.applied.txid < applied.txid) {
      session.applied = applied;
    }
  }
}

void Database::DropSessions() {
  {
    std::lock_guard lock(mutex_);
    ++epoch_;
    sessions_.clear();
  }
  cv_.notify_all();
}

uint64_t Database::Prune(const RetentionPolicy& policy, util::TimePoint now) {
  std::lock_guard lock(mutex_);

  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (!it->second.connected && now - it->second.disconnected_at >= policy.SessionWindow()) {
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }

  if (log_.empty()) return 0;
  if (policy.duration <= util::Duration::zero() && policy.max_frames == 0) return 0;

  // a frame leaves the horizon only once it is outside every configured bound
  uint64_t boundary = std::numeric_limits<uint64_t>::max();
  if (policy.duration > util::Duration::zero()) {
    uint64_t   time_cut = txid_ + 1;
    const auto oldest   = now - policy.duration;
    for (const auto& frame : log_) {
      if (util::FromUnixMillis(static_cast<uint64_t>(frame.timestamp_ms())) >= oldest) {
        time_cut = frame.txid();
        break;
      }
    }
    boundary = std::min(boundary, time_cut);
  }
  if (policy.max_frames > 0) {
    const uint64_t count_cut = log_.size() > policy.max_frames ? log_[log_.size() - policy.max_frames].txid() : log_.front().txid();
    boundary                 = std::min(boundary, count_cut);
  }

  uint64_t required = std::numeric_limits<uint64_t>::max();
  for (const auto& [_, session] : sessions_) {
    if (session.applied.generation == generation_ || session.applied.generation == 0) {
      required = std::min(required, session.applied.txid + 1);
    }
  }

  const uint64_t cutoff = std::min(boundary, required);
  if (cutoff <= log_.front().txid()) return 0;

  auto tx = repository_->Begin();
  ThrowIfError(repository_->DeleteFramesBefore(*tx, name_, cutoff), "delete frames");
  tx->Commit();

  uint64_t pruned = 0;
  while (!log_.empty() && log_.front().txid() < cutoff) {
    log_.pop_front();
    ++pruned;
  }

  observability::Metrics::Instance().RecordFramesPruned(name_, pruned);
  return pruned;
}

walship::core::v1::DatabaseStatus Database::Status() const {
  std::lock_guard lock(mutex_);

  walship::core::v1::DatabaseStatus status;
  status.set_name(name_);
  *status.mutable_position() = ToProto({generation_, txid_});
  status.set_retained_frames(log_.size());
  status.set_first_retained_txid(log_.empty() ? 0 : log_.front().txid());
  status.set_sessions(static_cast<uint32_t>(sessions_.size()));
  status.set_page_count(page_count_);
  return status;
}

} // namespace walship::store
