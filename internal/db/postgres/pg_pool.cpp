#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace walship::db::postgres {

PgPool::PgPool(std::string conninfo, PgPoolOptions options) : conninfo_(std::move(conninfo)), options_(std::move(options)) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  const auto       max = options_.max_connections == 0 ? 1 : options_.max_connections;
  if (!cv_.wait_for(lock, options_.acquire_timeout, [&] { return !idle_.empty() || live_ < max; })) {
    throw util::ConnectionError("postgres: no connection available within " + std::to_string(options_.acquire_timeout.count()) + "ms");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  ++live_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    if (options_.prepare) options_.prepare(*conn);
  } catch (const pqxx::broken_connection& e) {
    FreeSlot();
    throw util::ConnectionError(std::string("postgres connect: ") + e.what());
  } catch (const std::exception&) {
    FreeSlot();
    throw;
  }

  WALSHIP_LOG_DEBUG("postgres connection opened", {walship::observability::IntField("live", static_cast<int64_t>(LiveConnections()))});
  return Lend(std::move(conn));
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [weak_self](pqxx::connection* returned) {
    if (auto self = weak_self.lock()) {
      self->Return(returned);
      return;
    }
    delete returned;
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_;
    }
  }
  cv_.notify_one();
}

void PgPool::FreeSlot() {
  {
    std::lock_guard lock(mutex_);
    --live_;
  }
  cv_.notify_one();
}

} // namespace walship::db::postgres
