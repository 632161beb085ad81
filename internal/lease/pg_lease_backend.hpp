#pragma once

#include <memory>

#include "internal/db/postgres/pg_pool.hpp"
#include "lease_backend.hpp"

namespace walship::lease {

/*
  Lease backend on a PostgreSQL table (walship_leases).

  Every comparison uses the database server's now(), so nodes never compare
  their own clocks against each other.
*/
class PgLeaseBackend final : public LeaseBackend {
 public:
  PgLeaseBackend(std::string connection_uri, std::size_t max_connections);

  void Open() override;
  void Close() override;

  Lease                TryAcquire(const std::string& key, const Node& owner, util::Duration ttl, util::Duration lock_delay) override;
  Lease                Renew(const std::string& key, const std::string& lease_id, util::Duration ttl) override;
  void                 Release(const std::string& key, const std::string& lease_id) override;
  std::optional<Lease> Current(const std::string& key) override;

 private:
  static void PrepareStatements(pqxx::connection& conn);

  template <typename Fn>
  auto WithWork(Fn&& fn);

  std::string                               connection_uri_;
  std::size_t                               max_connections_;
  std::shared_ptr<db::postgres::PgPool> pool_;
};

} // namespace walship::lease
