#include "database_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace walship::store {

DatabaseRegistry::DatabaseRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void DatabaseRegistry::Load() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListDatabases(*tx);
  tx->Commit();

  std::lock_guard lock(mutex_);
  for (const auto& record : records) {
    auto database = std::make_shared<Database>(record.name, repository_);
    database->Load(record);
    databases_[record.name] = database;

    WALSHIP_LOG_INFO("database restored", {observability::StringField("database", record.name),
                                           observability::StringField("position", ToString(database->CurrentPosition()))});
  }
}

std::shared_ptr<Database> DatabaseRegistry::Get(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto            it = databases_.find(name);
  return it == databases_.end() ? nullptr : it->second;
}

std::shared_ptr<Database> DatabaseRegistry::GetOrCreate(const std::string& name) {
  if (name.empty()) {
    throw util::InvalidArgument("database name is required");
  }

  std::lock_guard lock(mutex_);
  auto& slot = databases_[name];
  if (!slot) {
    slot = std::make_shared<Database>(name, repository_);
    WALSHIP_LOG_DEBUG("database created", {observability::StringField("database", name)});
  }
  return slot;
}

std::vector<std::shared_ptr<Database>> DatabaseRegistry::List() const {
  std::lock_guard                        lock(mutex_);
  std::vector<std::shared_ptr<Database>> out;
  out.reserve(databases_.size());
  for (const auto& [_, database] : databases_) {
    out.push_back(database);
  }
  return out;
}

void DatabaseRegistry::DropSessions() {
  for (const auto& database : List()) {
    database->DropSessions();
  }
}

} // namespace walship::store
