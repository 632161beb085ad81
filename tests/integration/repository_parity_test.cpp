#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using walship::db::Repository;
using walship::db::memory::MemoryRepository;
using walship::db::model::DatabaseRecord;
using walship::db::model::FrameRecord;
using walship::db::model::PageRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

FrameRecord MakeFrame(const std::string& database, uint64_t txid) {
  return FrameRecord{.database = database, .generation = 7, .txid = txid, .timestamp_ms = static_cast<int64_t>(1000 * txid), .data = "frame-" + std::to_string(txid)};
}

void VerifyDatabaseUpsert(Repository& repo, const std::string& name) {
  auto tx = repo.Begin();
  assert(!repo.GetDatabase(*tx, name).has_value());

  assert(repo.UpsertDatabase(*tx, DatabaseRecord{.name = name, .generation = 7, .txid = 1, .page_count = 1}));
  assert(repo.UpsertDatabase(*tx, DatabaseRecord{.name = name, .generation = 7, .txid = 2, .page_count = 3}));

  auto record = repo.GetDatabase(*tx, name);
  assert(record.has_value());
  assert(record->generation == 7);
  assert(record->txid == 2);
  assert(record->page_count == 3);
  tx->Commit();

  auto check_tx = repo.Begin();
  bool found    = false;
  for (const auto& listed : repo.ListDatabases(*check_tx)) {
    found = found || listed.name == name;
  }
  assert(found);
  check_tx->Commit();
}

void VerifyFrameLog(Repository& repo, const std::string& database) {
  {
    auto tx = repo.Begin();
    for (uint64_t txid = 1; txid <= 5; ++txid) {
      assert(repo.AppendFrame(*tx, MakeFrame(database, txid)));
    }
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto frames = repo.ReadFrames(*tx, database);
    assert(frames.size() == 5);
    assert(frames[0].txid == 1);
    assert(frames[4].txid == 5);
    assert(frames[2].data == "frame-3");
    assert(frames[2].timestamp_ms == 3000);

    assert(repo.DeleteFramesBefore(*tx, database, 4));
    frames = repo.ReadFrames(*tx, database);
    assert(frames.size() == 2);
    assert(frames[0].txid == 4);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteAllFrames(*tx, database));
    assert(repo.ReadFrames(*tx, database).empty());
    tx->Commit();
  }
}

void VerifyPageImage(Repository& repo, const std::string& database) {
  auto tx = repo.Begin();

  std::vector<PageRecord> pages{{1, "one"}, {2, "two"}, {3, "three"}};
  assert(repo.WritePages(*tx, database, pages, 3));

  std::vector<PageRecord> update{{2, "two'"}};
  assert(repo.WritePages(*tx, database, update, 2));

  auto read = repo.ReadPages(*tx, database);
  assert(read.size() == 2);
  assert(read[0].pgno == 1);
  assert(read[1].data == "two'");

  std::vector<PageRecord> replacement{{4, "four"}};
  assert(repo.ReplacePages(*tx, database, replacement));
  read = repo.ReadPages(*tx, database);
  assert(read.size() == 1);
  assert(read[0].pgno == 4);

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& database) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertDatabase(*tx, DatabaseRecord{.name = database, .generation = 1, .txid = 1, .page_count = 1}));
    assert(repo.AppendFrame(*tx, MakeFrame(database, 1)));
    tx->Rollback();
  }

  // destructor without commit rolls back too
  {
    auto tx = repo.Begin();
    assert(repo.AppendFrame(*tx, MakeFrame(database, 2)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetDatabase(*check_tx, database).has_value());
  assert(repo.ReadFrames(*check_tx, database).empty());
  check_tx->Commit();
}

void VerifyDatabasesAreIsolated(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  assert(repo.AppendFrame(*tx, MakeFrame(prefix + "-a", 1)));
  assert(repo.AppendFrame(*tx, MakeFrame(prefix + "-b", 1)));
  assert(repo.AppendFrame(*tx, MakeFrame(prefix + "-b", 2)));

  assert(repo.DeleteFramesBefore(*tx, prefix + "-b", 2));
  assert(repo.ReadFrames(*tx, prefix + "-a").size() == 1);
  assert(repo.ReadFrames(*tx, prefix + "-b").size() == 1);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& database) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertDatabase(*tx, DatabaseRecord{.name = database, .generation = 9, .txid = 2, .page_count = 2}));
    assert(repo->AppendFrame(*tx, MakeFrame(database, 1)));
    assert(repo->AppendFrame(*tx, MakeFrame(database, 2)));
    std::vector<PageRecord> pages{{1, "a"}, {2, "b"}};
    assert(repo->WritePages(*tx, database, pages, 2));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto record = repo->GetDatabase(*tx, database);
  assert(record.has_value());
  assert(record->generation == 9);
  assert(record->txid == 2);
  assert(repo->ReadFrames(*tx, database).size() == 2);
  assert(repo->ReadPages(*tx, database).size() == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("walship_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<walship::db::sqlite::SqliteDB>(db_path);
    walship::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<walship::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyDatabaseUpsert(*repo, backend.name + "-upsert.db");
    VerifyFrameLog(*repo, backend.name + "-frames.db");
    VerifyPageImage(*repo, backend.name + "-pages.db");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback.db");
    VerifyDatabasesAreIsolated(*repo, backend.name + "-isolated");
  }

  VerifyRestartDurability(backend, backend.name + "-durable.db");

  backend.cleanup();
}

void VerifySqliteSchemaVersion() {
  const auto path = (std::filesystem::temp_directory_path() / ("walship_integration_schema_" + std::to_string(NowMs()) + ".db")).string();
  {
    auto db = std::make_shared<walship::db::sqlite::SqliteDB>(path, walship::db::sqlite::SqliteOptions{std::chrono::milliseconds(100), false});
    walship::db::sqlite::BootstrapSchema(*db);
    assert(db->SchemaVersion() == 1);
    // idempotent on reopen
    walship::db::sqlite::BootstrapSchema(*db);

    db->SetSchemaVersion(2);
    bool rejected = false;
    try {
      walship::db::sqlite::BootstrapSchema(*db);
    } catch (const std::runtime_error& e) {
      rejected = std::string(e.what()).find("newer") != std::string::npos;
    }
    assert(rejected);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifySqliteSchemaVersion();

  std::cout << "walship_integration_repository_parity: pass\n";
  return 0;
}
