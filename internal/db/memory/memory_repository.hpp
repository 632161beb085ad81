#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace walship::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::DatabaseRecord> databases;
    std::unordered_map<std::string, std::map<uint64_t, model::FrameRecord>> frames;
    std::unordered_map<std::string, std::map<uint32_t, std::string>> pages;
  };

  std::mutex mutex_;
  // held by an open transaction; writers are serialized like BEGIN IMMEDIATE
  std::mutex writer_mutex_;
  State committed_;
};

}
