#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace walship::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertDatabase(Transaction& t, const model::DatabaseRecord& r) {
  TX(t).Mutable().databases[r.name] = r;
  return Result::Ok();
}

std::optional<model::DatabaseRecord> MemoryRepository::GetDatabase(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.databases.find(name);
  if (it == s.databases.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DatabaseRecord> MemoryRepository::ListDatabases(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::DatabaseRecord> records;
  records.reserve(s.databases.size());
  for (const auto& [_, record] : s.databases) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::AppendFrame(Transaction& t, const model::FrameRecord& r) {
  auto& frames = TX(t).Mutable().frames[r.database];
  if (frames.contains(r.txid)) return Result::Err(ErrorCode::AlreadyExists, "frame already recorded");
  frames[r.txid] = r;
  return Result::Ok();
}

std::vector<model::FrameRecord> MemoryRepository::ReadFrames(Transaction& t, const std::string& database) {
  std::vector<model::FrameRecord> out;
  const auto&                     s  = TX(t).View();
  auto                            it = s.frames.find(database);
  if (it == s.frames.end()) return out;

  out.reserve(it->second.size());
  for (const auto& [_, frame] : it->second) {
    out.push_back(frame);
  }
  return out;
}

Result MemoryRepository::DeleteFramesBefore(Transaction& t, const std::string& database, uint64_t before_txid) {
  auto& s  = TX(t).Mutable();
  auto  it = s.frames.find(database);
  if (it == s.frames.end()) return Result::Ok();

  auto& frames = it->second;
  frames.erase(frames.begin(), frames.lower_bound(before_txid));
  return Result::Ok();
}

Result MemoryRepository::DeleteAllFrames(Transaction& t, const std::string& database) {
  TX(t).Mutable().frames.erase(database);
  return Result::Ok();
}

Result MemoryRepository::WritePages(Transaction& t, const std::string& database, const std::vector<model::PageRecord>& pages,
                                    uint32_t page_count) {
  auto& image = TX(t).Mutable().pages[database];
  for (const auto& page : pages) {
    image[page.pgno] = page.data;
  }
  image.erase(image.upper_bound(page_count), image.end());
  return Result::Ok();
}

Result MemoryRepository::ReplacePages(Transaction& t, const std::string& database, const std::vector<model::PageRecord>& pages) {
  auto& image = TX(t).Mutable().pages[database];
  image.clear();
  for (const auto& page : pages) {
    image[page.pgno] = page.data;
  }
  return Result::Ok();
}

std::vector<model::PageRecord> MemoryRepository::ReadPages(Transaction& t, const std::string& database) {
  std::vector<model::PageRecord> out;
  const auto&                    s  = TX(t).View();
  auto                           it = s.pages.find(database);
  if (it == s.pages.end()) return out;

  out.reserve(it->second.size());
  for (const auto& [pgno, data] : it->second) {
    out.push_back({pgno, data});
  }
  return out;
}

} // namespace walship::db::memory
