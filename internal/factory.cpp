#include "factory.hpp"

#include <unistd.h>

#include <climits>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/database_server.hpp"
#include "internal/grpc/grpc_primary_client.hpp"
#include "internal/grpc/replication_server.hpp"
#include "internal/lease/coordinated_leaser.hpp"
#include "internal/lease/lease_table.hpp"
#include "internal/lease/static_leaser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/status_registry.hpp"
#include "internal/retention/retention_monitor.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/database_service.hpp"
#include "internal/service/replication_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/database_registry.hpp"
#include "internal/store/store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if WALSHIP_DB_POSTGRES
#include "internal/lease/pg_lease_backend.hpp"
#endif

namespace walship::factory {

using walship::runtime::config::RuntimeConfig;

namespace {

std::string LocalHostname() {
  char buf[HOST_NAME_MAX + 1] = {};
  if (gethostname(buf, sizeof(buf) - 1) != 0) {
    return "localhost";
  }
  return buf;
}

std::string BindPort(const std::string& bind_address) {
  const auto pos = bind_address.rfind(':');
  return pos == std::string::npos ? std::string("20202") : bind_address.substr(pos + 1);
}

std::shared_ptr<lease::LeaseBackend> BuildLeaseBackend(const walship::runtime::config::CoordinatedLeaseConfig& coordinated) {
  if (coordinated.has_postgres()) {
#if WALSHIP_DB_POSTGRES
    const auto max_connections = coordinated.postgres().max_connections() == 0 ? 4u : coordinated.postgres().max_connections();
    return std::make_shared<lease::PgLeaseBackend>(coordinated.postgres().connection_uri(), max_connections);
#else
    throw util::ConfigError("postgres lease backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<lease::LeaseTable>();
}

} // namespace

lease::Node SelfNode(const RuntimeConfig& config) {
  lease::Node self;
  self.candidate = config.candidate();

  if (config.has_coordinated()) {
    self.hostname      = config.coordinated().hostname();
    self.advertise_url = config.coordinated().advertise_url();
  } else if (config.static_().primary()) {
    self.hostname      = config.static_().hostname();
    self.advertise_url = config.static_().advertise_url();
  }

  if (self.hostname.empty()) {
    self.hostname = LocalHostname();
  }
  if (self.advertise_url.empty()) {
    self.advertise_url = "http://" + self.hostname + ":" + BindPort(config.server().bind_address());
  }
  return self;
}

std::shared_ptr<lease::Leaser> BuildLeaser(const RuntimeConfig& config) {
  auto self = SelfNode(config);

  if (config.has_static_()) {
    const auto& static_config = config.static_();

    lease::Node primary;
    primary.hostname      = static_config.hostname();
    primary.advertise_url = static_config.advertise_url();
    primary.candidate     = true;
    return std::make_shared<lease::StaticLeaser>(static_config.primary(), std::move(self), std::move(primary));
  }

  if (config.has_coordinated()) {
    const auto& coordinated = config.coordinated();

    lease::CoordinatedLeaserOptions options;
    options.key        = coordinated.key();
    options.ttl        = util::FromProto(coordinated.ttl(), options.ttl);
    options.lock_delay = util::FromProto(coordinated.lock_delay(), options.lock_delay);
    options.self       = std::move(self);
    return std::make_shared<lease::CoordinatedLeaser>(BuildLeaseBackend(coordinated), std::move(options));
  }

  throw util::ConfigError("no lease mode configured");
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& storage = config.storage();
  if (storage.has_sqlite()) {
    const std::filesystem::path path(storage.sqlite().path());
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }

    db::sqlite::SqliteOptions options;
    options.busy_timeout = util::FromProto(storage.sqlite().busy_timeout(), options.busy_timeout);
    options.full_sync    = storage.sqlite().synchronous() != "NORMAL";

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string(), options);
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto registry   = std::make_shared<store::DatabaseRegistry>(repository);
  registry->Load();

  // ------------------------------------------------------------------
  // Election
  // ------------------------------------------------------------------
  auto leaser = BuildLeaser(config);

  const auto& replication = config.replication();

  store::StoreOptions options;
  options.candidate     = config.has_static_() ? config.static_().primary() : config.candidate();
  options.poll_interval = util::FromProto(replication.poll_interval(), options.poll_interval);
  options.backoff_min   = util::FromProto(replication.reconnect_backoff_min(), options.backoff_min);
  options.backoff_max   = util::FromProto(replication.reconnect_backoff_max(), options.backoff_max);
  if (config.has_coordinated()) {
    options.renew_interval = util::FromProto(config.coordinated().renew_interval(), options.renew_interval);
  }

  app.store = std::make_shared<store::Store>(options, leaser, registry, std::make_shared<grpc::GrpcPrimaryClientFactory>());

  app.status = std::make_shared<observability::StatusRegistry>();
  app.status->Publish("store", [weak = std::weak_ptr<store::Store>(app.store)] {
    auto store = weak.lock();
    return store ? store->StatusJson() : std::string("{}");
  });

  // ------------------------------------------------------------------
  // Retention
  // ------------------------------------------------------------------
  const auto& retention = config.retention();

  store::RetentionPolicy policy;
  policy.duration   = util::FromProto(retention.duration());
  policy.max_frames = retention.max_frames();
  app.retention     = std::make_shared<retention::RetentionMonitor>(registry, policy, util::FromProto(retention.monitor_interval(), std::chrono::minutes(1)));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store  = app.store;
  ctx.status = app.status;

  service::StreamOptions stream_options;
  stream_options.heartbeat_interval = util::FromProto(replication.heartbeat_interval(), stream_options.heartbeat_interval);
  stream_options.max_batch_frames   = replication.max_batch_frames() == 0 ? stream_options.max_batch_frames : replication.max_batch_frames();

  auto replication_service = std::make_shared<service::ReplicationService>(ctx, stream_options);
  auto database_service    = std::make_shared<service::DatabaseService>(ctx);
  auto admin_service       = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ReplicationServer>(replication_service));
  app.grpc_services.push_back(std::make_unique<grpc::DatabaseServer>(database_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  WALSHIP_LOG_INFO("node configured", {observability::StringField("hostname", leaser->Self().hostname),
                                       observability::StringField("advertise_url", leaser->Self().advertise_url),
                                       observability::StringField("lease", config.has_static_() ? "static" : "coordinated"),
                                       observability::BoolField("candidate", options.candidate)});
  return app;
}

} // namespace walship::factory
