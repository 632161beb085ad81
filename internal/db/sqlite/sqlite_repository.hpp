#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace walship::db::sqlite {

// Creates the databases/frames/pages tables and stamps user_version.
// Throws on a file written by a newer schema.
void BootstrapSchema(SqliteDB& db);

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertDatabase(Transaction&, const model::DatabaseRecord&) override;
  std::optional<model::DatabaseRecord> GetDatabase(Transaction&, const std::string& name) override;
  std::vector<model::DatabaseRecord> ListDatabases(Transaction&) override;

  Result AppendFrame(Transaction&, const model::FrameRecord&) override;
  std::vector<model::FrameRecord> ReadFrames(Transaction&, const std::string& database) override;
  Result DeleteFramesBefore(Transaction&, const std::string& database, uint64_t before_txid) override;
  Result DeleteAllFrames(Transaction&, const std::string& database) override;

  Result WritePages(Transaction&, const std::string& database, const std::vector<model::PageRecord>& pages,
                    uint32_t page_count) override;
  Result ReplacePages(Transaction&, const std::string& database, const std::vector<model::PageRecord>& pages) override;
  std::vector<model::PageRecord> ReadPages(Transaction&, const std::string& database) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
