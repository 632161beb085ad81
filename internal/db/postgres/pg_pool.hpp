#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace walship::db::postgres {

struct PgPoolOptions {
  std::size_t max_connections = 2;
  // Acquire() throws after waiting this long for a free slot.
  std::chrono::milliseconds acquire_timeout{2000};
  // Runs once on every new connection, before first use.
  std::function<void(pqxx::connection&)> prepare;
};

/*
  Small pool of libpqxx connections for the lease backend.

  A pqxx::connection is single-caller. Acquire() hands one out as a
  shared_ptr whose deleter returns it to the pool; a connection that is no
  longer open is discarded on return and its slot freed. Acquire() throws
  util::ConnectionError when no slot frees up within acquire_timeout or the
  server refuses a new connection.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, PgPoolOptions options);

  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections() const;

 private:
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);
  void                              FreeSlot();

  const std::string   conninfo_;
  const PgPoolOptions options_;

  mutable std::mutex                              mutex_;
  std::condition_variable                         cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                     live_ = 0;
};

} // namespace walship::db::postgres
