#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>

namespace walship::db::sqlite {

using walship::db::ErrorCode;
using walship::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

constexpr int kSchemaVersion = 1;

// Read helpers throw: a failed read is a local storage failure.
void ThrowPrepare(sqlite3* db) {
  throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  const int version = db.SchemaVersion();
  if (version == kSchemaVersion) return;
  if (version > kSchemaVersion) {
    throw std::runtime_error(db.Path() + ": schema version " + std::to_string(version) + " is newer than supported " +
                             std::to_string(kSchemaVersion));
  }

  std::lock_guard lock(db.TxMutex());
  db.Exec("BEGIN IMMEDIATE;");
  try {
    db.Exec("CREATE TABLE IF NOT EXISTS databases (name TEXT PRIMARY KEY, generation INTEGER NOT NULL, txid INTEGER NOT NULL, "
            "page_count INTEGER NOT NULL);");
    db.Exec("CREATE TABLE IF NOT EXISTS frames (database TEXT NOT NULL, txid INTEGER NOT NULL, generation INTEGER NOT NULL, "
            "timestamp_ms INTEGER NOT NULL, data BLOB NOT NULL, PRIMARY KEY (database, txid));");
    db.Exec("CREATE TABLE IF NOT EXISTS pages (database TEXT NOT NULL, pgno INTEGER NOT NULL, data BLOB NOT NULL, "
            "PRIMARY KEY (database, pgno));");
    db.SetSchemaVersion(kSchemaVersion);
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Databases
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDatabase(Transaction& t, const model::DatabaseRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO databases(name,generation,txid,page_count) VALUES(?,?,?,?) "
               "ON CONFLICT(name) DO UPDATE SET generation=excluded.generation, txid=excluded.txid, page_count=excluded.page_count;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);
  BindU64(st.get(), 2, r.generation);
  BindU64(st.get(), 3, r.txid);
  BindU64(st.get(), 4, r.page_count);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DatabaseRecord> SqliteRepository::GetDatabase(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT name,generation,txid,page_count FROM databases WHERE name=?;");
  if (!st) ThrowPrepare(db);

  BindText(st.get(), 1, name);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::DatabaseRecord r;
  r.name       = ColText(st.get(), 0);
  r.generation = ColU64(st.get(), 1);
  r.txid       = ColU64(st.get(), 2);
  r.page_count = static_cast<uint32_t>(ColU64(st.get(), 3));
  return r;
}

std::vector<model::DatabaseRecord> SqliteRepository::ListDatabases(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT name,generation,txid,page_count FROM databases ORDER BY name;");
  if (!st) ThrowPrepare(db);

  std::vector<model::DatabaseRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::DatabaseRecord r;
    r.name       = ColText(st.get(), 0);
    r.generation = ColU64(st.get(), 1);
    r.txid       = ColU64(st.get(), 2);
    r.page_count = static_cast<uint32_t>(ColU64(st.get(), 3));
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Frames
// ------------------------------------------------------------------

Result SqliteRepository::AppendFrame(Transaction& t, const model::FrameRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO frames(database,txid,generation,timestamp_ms,data) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.database);
  BindU64(st.get(), 2, r.txid);
  BindU64(st.get(), 3, r.generation);
  BindI64(st.get(), 4, r.timestamp_ms);
  BindBlob(st.get(), 5, r.data);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::FrameRecord> SqliteRepository::ReadFrames(Transaction& t, const std::string& database) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT txid,generation,timestamp_ms,data FROM frames WHERE database=? ORDER BY txid;");
  if (!st) ThrowPrepare(db);

  BindText(st.get(), 1, database);

  std::vector<model::FrameRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::FrameRecord r;
    r.database     = database;
    r.txid         = ColU64(st.get(), 0);
    r.generation   = ColU64(st.get(), 1);
    r.timestamp_ms = ColI64(st.get(), 2);
    r.data         = ColBlob(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::DeleteFramesBefore(Transaction& t, const std::string& database, uint64_t before_txid) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM frames WHERE database=? AND txid<?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, database);
  BindU64(st.get(), 2, before_txid);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteAllFrames(Transaction& t, const std::string& database) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM frames WHERE database=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, database);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Pages
// ------------------------------------------------------------------

Result SqliteRepository::WritePages(Transaction& t, const std::string& database, const std::vector<model::PageRecord>& pages,
                                    uint32_t page_count) {
  auto* db = TX(t).Handle();

  {
    Statement st(db, "INSERT INTO pages(database,pgno,data) VALUES(?,?,?) ON CONFLICT(database,pgno) DO UPDATE SET data=excluded.data;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& page : pages) {
      BindText(st.get(), 1, database);
      BindU64(st.get(), 2, page.pgno);
      BindBlob(st.get(), 3, page.data);

      auto res = Translate(db, sqlite3_step(st.get()));
      if (!res) return res;
      sqlite3_reset(st.get());
    }
  }

  Statement truncate(db, "DELETE FROM pages WHERE database=? AND pgno>?;");
  if (!truncate) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(truncate.get(), 1, database);
  BindU64(truncate.get(), 2, page_count);
  return Translate(db, sqlite3_step(truncate.get()));
}

Result SqliteRepository::ReplacePages(Transaction& t, const std::string& database, const std::vector<model::PageRecord>& pages) {
  auto* db = TX(t).Handle();

  {
    Statement clear(db, "DELETE FROM pages WHERE database=?;");
    if (!clear) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(clear.get(), 1, database);
    auto res = Translate(db, sqlite3_step(clear.get()));
    if (!res) return res;
  }

  uint32_t max_pgno = 0;
  for (const auto& page : pages) {
    max_pgno = std::max(max_pgno, page.pgno);
  }
  return WritePages(t, database, pages, max_pgno);
}

std::vector<model::PageRecord> SqliteRepository::ReadPages(Transaction& t, const std::string& database) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT pgno,data FROM pages WHERE database=? ORDER BY pgno;");
  if (!st) ThrowPrepare(db);

  BindText(st.get(), 1, database);

  std::vector<model::PageRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({static_cast<uint32_t>(ColU64(st.get(), 0)), ColBlob(st.get(), 1)});
  }
  return out;
}

} // namespace walship::db::sqlite
