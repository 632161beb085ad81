#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace walship::db::sqlite {

// BEGIN IMMEDIATE on construction; holds the connection's TxMutex until finished.
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void Finish(const char* sql, State next);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  State                        state_ = State::kOpen;
};

} // namespace walship::db::sqlite
