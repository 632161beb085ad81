#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace walship::db::sqlite {

struct SqliteOptions {
  std::chrono::milliseconds busy_timeout{5000};
  // Commits of a replicated frame must survive power loss; NORMAL trades that for speed.
  bool full_sync = true;
};

/*
  One sqlite3 connection shared by the store's writers and the retention worker.

  Transactions serialize on TxMutex(); the handle is opened FULLMUTEX so
  statement preparation outside a transaction is also safe.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }
  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  // PRAGMA user_version
  int SchemaVersion();
  void SetSchemaVersion(int version);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace walship::db::sqlite
