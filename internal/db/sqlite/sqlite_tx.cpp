#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace walship::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;

  try {
    Finish("ROLLBACK;", State::kRolledBack);
  } catch (const std::exception& e) {
    WALSHIP_LOG_WARN("sqlite rollback failed", {walship::observability::StringField("path", db_->Path()),
                                                walship::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) throw std::logic_error("sqlite transaction already finished");
  // a failed COMMIT leaves the transaction open; the destructor rolls it back
  Finish("COMMIT;", State::kCommitted);
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  Finish("ROLLBACK;", State::kRolledBack);
}

void SqliteTransaction::Finish(const char* sql, State next) {
  db_->Exec(sql);
  state_ = next;
  lock_.unlock();
}

} // namespace walship::db::sqlite
