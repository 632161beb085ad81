#include "sqlite_db.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace walship::db::sqlite {

namespace {

[[noreturn]] void Fail(sqlite3* db, const std::string& what) {
  throw std::runtime_error("sqlite " + what + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + msg);
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
    Fail(db_, "user_version");
  }
  int version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return version;
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure() {
  // frames and pages are read by the retention worker while a commit is in flight
  Exec("PRAGMA journal_mode=WAL;");
  Exec(options_.full_sync ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");

  if (sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count())) != SQLITE_OK) {
    Fail(db_, "busy_timeout");
  }

  WALSHIP_LOG_DEBUG("sqlite opened", {walship::observability::StringField("path", path_),
                                      walship::observability::BoolField("full_sync", options_.full_sync),
                                      walship::observability::DurationField("busy_timeout", options_.busy_timeout)});
}

} // namespace walship::db::sqlite
