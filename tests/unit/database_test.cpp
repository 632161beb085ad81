#include "internal/store/database.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using walship::core::v1::Frame;
using walship::store::Database;
using walship::store::Position;
using namespace std::chrono_literals;

Frame MakeFrame(uint32_t pgno, const std::string& data, uint32_t commit = 0) {
  Frame frame;
  auto* page = frame.add_pages();
  page->set_pgno(pgno);
  page->set_data(data);
  frame.set_commit(commit);
  return frame;
}

std::shared_ptr<Database> MakeDatabase() {
  return std::make_shared<Database>("app.db", std::make_shared<walship::db::memory::MemoryRepository>());
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCommitAssignsMonotonicTxids() {
  auto db = MakeDatabase();
  assert(db->CurrentPosition().IsEmpty());

  const auto first = db->Commit(MakeFrame(1, "a"));
  assert(first.generation != 0);
  assert(first.txid == 1);

  const auto second = db->Commit(MakeFrame(2, "b"));
  assert(second.generation == first.generation);
  assert(second.txid == 2);

  const auto snapshot = db->GetSnapshot();
  assert(snapshot.position == second);
  assert(snapshot.page_count == 2);
  assert(snapshot.pages.size() == 2);
  assert(snapshot.pages[0].data == "a");

  auto status = db->Status();
  assert(status.retained_frames() == 2);
  assert(status.first_retained_txid() == 1);
}

void TestCommitValidation() {
  auto db = MakeDatabase();

  assert(Throws<walship::util::InvalidArgument>([&] { db->Commit(Frame{}); }));
  assert(Throws<walship::util::InvalidArgument>([&] { db->Commit(MakeFrame(0, "x")); }));
  assert(Throws<walship::util::InvalidArgument>([&] { db->Commit(MakeFrame(5, "x", 3)); }));

  // rejected commits leave the position untouched
  assert(db->CurrentPosition().IsEmpty());
}

void TestCommitTruncatesPages() {
  auto db = MakeDatabase();
  db->Commit(MakeFrame(1, "a"));
  db->Commit(MakeFrame(2, "b"));
  db->Commit(MakeFrame(3, "c"));

  db->Commit(MakeFrame(1, "a2", 1));
  const auto snapshot = db->GetSnapshot();
  assert(snapshot.page_count == 1);
  assert(snapshot.pages.size() == 1);
  assert(snapshot.pages[0].data == "a2");
}

void TestResumeRules() {
  auto db = MakeDatabase();
  for (int i = 1; i <= 3; ++i) {
    db->Commit(MakeFrame(1, "v" + std::to_string(i)));
  }
  const auto gen = db->CurrentPosition().generation;

  // from scratch, mid-log and at the tip are all served
  db->OpenSession("r1", {});
  db->OpenSession("r2", {gen, 1});
  db->OpenSession("r3", {gen, 3});

  assert(Throws<walship::util::PositionTooOldError>([&] { db->OpenSession("r4", {gen, 4}); }));
  assert(Throws<walship::util::PositionTooOldError>([&] { db->OpenSession("r5", {gen + 1, 2}); }));
}

void TestWaitFramesDeliversInOrder() {
  auto db = MakeDatabase();
  db->Commit(MakeFrame(1, "a"));
  const auto gen = db->CurrentPosition().generation;

  const auto session = db->OpenSession("replica", {});

  Position current;
  auto     frames = db->WaitFrames(session, 10ms, 0, &current);
  assert(frames.size() == 1);
  assert(frames[0].txid() == 1);
  assert(current == (Position{gen, 1}));
  db->AdvanceSession(session, {gen, 1});

  // nothing new: times out with an empty batch
  assert(db->WaitFrames(session, 10ms, 0, &current).empty());

  std::thread writer([&] {
    std::this_thread::sleep_for(20ms);
    db->Commit(MakeFrame(1, "b"));
    db->Commit(MakeFrame(2, "c"));
  });
  frames = db->WaitFrames(session, 5s, 0, &current);
  writer.join();
  assert(!frames.empty());
  assert(frames[0].txid() == 2);

  db->AdvanceSession(session, {gen, frames.back().txid()});
  if (frames.back().txid() < 3) {
    frames = db->WaitFrames(session, 1s, 0, &current);
    assert(frames.size() == 1);
    assert(frames[0].txid() == 3);
  }
}

void TestWaitFramesHonoursBatchLimit() {
  auto db = MakeDatabase();
  for (int i = 0; i < 5; ++i) {
    db->Commit(MakeFrame(1, "v"));
  }

  const auto session = db->OpenSession("replica", {});
  const auto frames  = db->WaitFrames(session, 10ms, 2, nullptr);
  assert(frames.size() == 2);
  assert(frames[0].txid() == 1);
  assert(frames[1].txid() == 2);
}

void TestDropSessionsWakesWaiters() {
  auto db = MakeDatabase();
  db->Commit(MakeFrame(1, "a"));
  const auto gen     = db->CurrentPosition().generation;
  const auto session = db->OpenSession("replica", {gen, 1});

  std::thread dropper([&] {
    std::this_thread::sleep_for(20ms);
    db->DropSessions();
  });
  const bool dropped = Throws<walship::util::NotPrimaryError>([&] { db->WaitFrames(session, 5s, 0, nullptr); });
  dropper.join();
  assert(dropped);
  assert(db->Status().sessions() == 0);
}

void TestApplyFrameRules() {
  auto primary = MakeDatabase();
  primary->Commit(MakeFrame(1, "a"));
  primary->Commit(MakeFrame(2, "b"));
  primary->Commit(MakeFrame(3, "c"));
  const auto gen = primary->CurrentPosition().generation;

  const auto session = primary->OpenSession("replica", {});
  const auto frames  = primary->WaitFrames(session, 10ms, 0, nullptr);
  assert(frames.size() == 3);

  auto replica = MakeDatabase();
  assert(replica->ApplyFrame({gen, 1}, frames[0]));
  assert(replica->CurrentPosition() == (Position{gen, 1}));

  // duplicate is a no-op
  assert(!replica->ApplyFrame({gen, 1}, frames[0]));

  // gap
  assert(Throws<walship::util::DesyncError>([&] { replica->ApplyFrame({gen, 3}, frames[2]); }));

  // generation change
  assert(Throws<walship::util::DesyncError>([&] { replica->ApplyFrame({gen + 1, 2}, frames[1]); }));

  assert(replica->ApplyFrame({gen, 2}, frames[1]));
  assert(replica->ApplyFrame({gen, 3}, frames[2]));

  const auto snapshot = replica->GetSnapshot();
  assert(snapshot.position == primary->CurrentPosition());
  assert(snapshot.pages.size() == 3);
  assert(snapshot.pages[2].data == "c");
}

void TestApplySnapshotReplacesState() {
  auto primary = MakeDatabase();
  primary->Commit(MakeFrame(1, "a"));
  primary->Commit(MakeFrame(2, "b"));

  auto replica = MakeDatabase();
  replica->Commit(MakeFrame(1, "stale"));
  replica->Commit(MakeFrame(7, "stale"));

  replica->ApplySnapshot(primary->GetSnapshot());

  const auto snapshot = replica->GetSnapshot();
  assert(snapshot.position == primary->CurrentPosition());
  assert(snapshot.page_count == 2);
  assert(snapshot.pages.size() == 2);
  assert(snapshot.pages[0].data == "a");
  assert(replica->Status().retained_frames() == 0);
}

void TestLoadRestoresFromRepository() {
  auto repository = std::make_shared<walship::db::memory::MemoryRepository>();

  Position position;
  {
    Database db("app.db", repository);
    db.Commit(MakeFrame(1, "a"));
    position = db.Commit(MakeFrame(2, "b"));
  }

  auto tx     = repository->Begin();
  auto record = repository->GetDatabase(*tx, "app.db");
  tx->Commit();
  assert(record.has_value());

  Database restored("app.db", repository);
  restored.Load(*record);
  assert(restored.CurrentPosition() == position);
  assert(restored.Status().retained_frames() == 2);
  assert(restored.GetSnapshot().pages.size() == 2);

  assert(restored.Commit(MakeFrame(1, "c")).txid == 3);
}

// a led up to txid 6; b took over having applied only up to 5.
void TestNewGenerationRejectsFormerLineage() {
  auto a          = MakeDatabase();
  auto repository = std::make_shared<walship::db::memory::MemoryRepository>();
  auto b          = std::make_shared<Database>("app.db", repository);

  for (int i = 1; i <= 5; ++i) {
    a->Commit(MakeFrame(1, "v" + std::to_string(i)));
  }
  b->ApplySnapshot(a->GetSnapshot());
  const auto shared = b->CurrentPosition();

  a->Commit(MakeFrame(1, "a-only"));

  const auto started = b->BeginGeneration();
  assert(started.generation != 0);
  assert(started.generation != shared.generation);
  assert(started.txid == shared.txid);
  assert(b->Status().retained_frames() == 0);

  const auto b6 = b->Commit(MakeFrame(1, "b6"));
  assert(b6.generation == started.generation);
  assert(b6.txid == a->CurrentPosition().txid);

  // same txid, different history: a must not resume on top of b
  assert(Throws<walship::util::PositionTooOldError>([&] { b->OpenSession("a", a->CurrentPosition()); }));
  assert(Throws<walship::util::PositionTooOldError>([&] { b->OpenSession("c", shared); }));
  auto next = MakeFrame(1, "b6");
  next.set_txid(b6.txid);
  assert(Throws<walship::util::DesyncError>([&] { a->ApplyFrame(b6, next); }));

  a->ApplySnapshot(b->GetSnapshot());
  assert(a->CurrentPosition() == b6);
  assert(a->GetSnapshot().pages[0].data == "b6");

  auto tx     = repository->Begin();
  auto record = repository->GetDatabase(*tx, "app.db");
  tx->Commit();
  assert(record.has_value());
  assert(record->generation == b6.generation);

  // nothing committed yet: the first commit picks the generation
  assert(MakeDatabase()->BeginGeneration().IsEmpty());
}

} // namespace

int main() {
  TestCommitAssignsMonotonicTxids();
  TestCommitValidation();
  TestCommitTruncatesPages();
  TestResumeRules();
  TestWaitFramesDeliversInOrder();
  TestWaitFramesHonoursBatchLimit();
  TestDropSessionsWakesWaiters();
  TestApplyFrameRules();
  TestApplySnapshotReplacesState();
  TestLoadRestoresFromRepository();
  TestNewGenerationRejectsFormerLineage();

  std::cout << "walship_unit_database: pass\n";
  return 0;
}
