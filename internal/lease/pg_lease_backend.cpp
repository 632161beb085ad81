#include "pg_lease_backend.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace walship::lease {

namespace {

constexpr const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS walship_leases ("
    "key TEXT PRIMARY KEY, lease_id TEXT NOT NULL, hostname TEXT NOT NULL, advertise_url TEXT NOT NULL, "
    "term_start TIMESTAMPTZ NOT NULL, expires_at TIMESTAMPTZ NOT NULL, lock_delay_ms BIGINT NOT NULL);";

constexpr const char* kReturning =
    " RETURNING lease_id, hostname, advertise_url, "
    "(extract(epoch from term_start) * 1000)::bigint, (extract(epoch from expires_at) * 1000)::bigint, lock_delay_ms";

Lease FromRow(const pqxx::row& row, util::Duration ttl) {
  Lease lease;
  lease.id                  = row[0].c_str();
  lease.owner.hostname      = row[1].c_str();
  lease.owner.advertise_url = row[2].c_str();
  lease.owner.candidate     = true;
  lease.term_start          = util::FromUnixMillis(row[3].as<uint64_t>());
  lease.expires_at          = util::FromUnixMillis(row[4].as<uint64_t>());
  lease.lock_delay          = util::Duration(row[5].as<int64_t>());
  lease.ttl                 = ttl;
  return lease;
}

} // namespace

PgLeaseBackend::PgLeaseBackend(std::string connection_uri, std::size_t max_connections)
    : connection_uri_(std::move(connection_uri)), max_connections_(max_connections) {
}

void PgLeaseBackend::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("lease_acquire",
               std::string("INSERT INTO walship_leases AS l (key, lease_id, hostname, advertise_url, term_start, expires_at, lock_delay_ms) "
                           "VALUES ($1, $2, $3, $4, now(), now() + $5 * interval '1 millisecond', $6) "
                           "ON CONFLICT (key) DO UPDATE SET lease_id = EXCLUDED.lease_id, hostname = EXCLUDED.hostname, "
                           "advertise_url = EXCLUDED.advertise_url, term_start = EXCLUDED.term_start, "
                           "expires_at = EXCLUDED.expires_at, lock_delay_ms = EXCLUDED.lock_delay_ms "
                           "WHERE l.expires_at + l.lock_delay_ms * interval '1 millisecond' <= now()") +
                   kReturning);

  conn.prepare("lease_renew",
               std::string("UPDATE walship_leases SET expires_at = now() + $3 * interval '1 millisecond' "
                           "WHERE key = $1 AND lease_id = $2 AND expires_at > now()") +
                   kReturning);

  conn.prepare("lease_release", "UPDATE walship_leases SET expires_at = now() WHERE key = $1 AND lease_id = $2 AND expires_at > now()");

  conn.prepare("lease_current",
               "SELECT lease_id, hostname, advertise_url, (extract(epoch from term_start) * 1000)::bigint, "
               "(extract(epoch from expires_at) * 1000)::bigint, lock_delay_ms, "
               "(extract(epoch from expires_at - term_start) * 1000)::bigint "
               "FROM walship_leases WHERE key = $1 AND expires_at > now()");
}

template <typename Fn>
auto PgLeaseBackend::WithWork(Fn&& fn) {
  if (!pool_) {
    throw util::ConnectionError("postgres lease backend not open");
  }

  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       out = fn(tx);
    tx.commit();
    return out;
  } catch (const pqxx::broken_connection& e) {
    throw util::ConnectionError(std::string("postgres: ") + e.what());
  }
}

void PgLeaseBackend::Open() {
  try {
    db::postgres::PgPoolOptions options;
    options.max_connections = max_connections_;
    options.prepare         = &PgLeaseBackend::PrepareStatements;
    auto pool               = std::make_shared<db::postgres::PgPool>(connection_uri_, std::move(options));
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      tx.exec(kSchemaSql);
      tx.commit();
    }
    pool_ = std::move(pool);
  } catch (const pqxx::broken_connection& e) {
    throw util::ConnectionError(std::string("cannot connect to postgres: ") + e.what());
  }
}

void PgLeaseBackend::Close() {
  pool_.reset();
}

Lease PgLeaseBackend::TryAcquire(const std::string& key, const Node& owner, util::Duration ttl, util::Duration lock_delay) {
  const auto lease_id = util::NewLeaseId();
  auto       rows     = WithWork([&](pqxx::work& tx) {
    return tx.exec_prepared("lease_acquire", key, lease_id, owner.hostname, owner.advertise_url, ttl.count(), lock_delay.count());
  });

  if (rows.empty()) {
    throw util::LeaseHeldError("lease " + key + " held or inside lock-delay");
  }
  return FromRow(rows[0], ttl);
}

Lease PgLeaseBackend::Renew(const std::string& key, const std::string& lease_id, util::Duration ttl) {
  auto rows = WithWork([&](pqxx::work& tx) { return tx.exec_prepared("lease_renew", key, lease_id, ttl.count()); });

  if (rows.empty()) {
    throw util::LeaseLostError("lease " + key + " no longer held");
  }
  return FromRow(rows[0], ttl);
}

void PgLeaseBackend::Release(const std::string& key, const std::string& lease_id) {
  WithWork([&](pqxx::work& tx) { return tx.exec_prepared("lease_release", key, lease_id); });
}

std::optional<Lease> PgLeaseBackend::Current(const std::string& key) {
  auto rows = WithWork([&](pqxx::work& tx) { return tx.exec_prepared("lease_current", key); });

  if (rows.empty()) {
    return std::nullopt;
  }
  return FromRow(rows[0], util::Duration(rows[0][6].as<int64_t>()));
}

} // namespace walship::lease
