#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "database.hpp"
#include "internal/db/api/repository.hpp"

namespace walship::store {

/*
  Catalog of replicated databases.

  Entries are created on first write (commit on a primary, first stream on a
  replica) and live for the process lifetime.
*/
class DatabaseRegistry {
 public:
  explicit DatabaseRegistry(std::shared_ptr<db::Repository> repository);

  // Restores every database recorded in the repository.
  void Load();

  // nullptr if unknown.
  std::shared_ptr<Database> Get(const std::string& name) const;

  std::shared_ptr<Database> GetOrCreate(const std::string& name);

  // Sorted by name.
  std::vector<std::shared_ptr<Database>> List() const;

  void DropSessions();

 private:
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex                               mutex_;
  std::map<std::string, std::shared_ptr<Database>> databases_;
};

} // namespace walship::store
