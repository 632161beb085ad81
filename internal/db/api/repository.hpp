#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/database_record.hpp"
#include "internal/db/model/frame_record.hpp"
#include "internal/db/model/page_record.hpp"

namespace walship::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A frame, its page writes and the new database position commit together

  The DB is the source of truth for:
    database positions
    retained frame log
    page image
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Databases
  // ---------------------------------------------------------------------

  virtual Result UpsertDatabase(Transaction&, const model::DatabaseRecord&) = 0;

  virtual std::optional<model::DatabaseRecord> GetDatabase(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::DatabaseRecord> ListDatabases(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Frame log
  // ---------------------------------------------------------------------

  virtual Result AppendFrame(Transaction&, const model::FrameRecord&) = 0;

  // Ordered by txid.
  virtual std::vector<model::FrameRecord> ReadFrames(Transaction&, const std::string& database) = 0;

  // Removes frames with txid < before_txid.
  virtual Result DeleteFramesBefore(Transaction&, const std::string& database, uint64_t before_txid) = 0;

  virtual Result DeleteAllFrames(Transaction&, const std::string& database) = 0;

  // ---------------------------------------------------------------------
  // Page image
  // ---------------------------------------------------------------------

  // Upserts `pages`, then drops every page numbered above page_count.
  virtual Result WritePages(Transaction&, const std::string& database, const std::vector<model::PageRecord>& pages, uint32_t page_count) = 0;

  virtual Result ReplacePages(Transaction&, const std::string& database, const std::vector<model::PageRecord>& pages) = 0;

  // Ordered by pgno.
  virtual std::vector<model::PageRecord> ReadPages(Transaction&, const std::string& database) = 0;
};

} // namespace walship::db
