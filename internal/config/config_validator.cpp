#include "config_validator.hpp"

#include <chrono>
#include <filesystem>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace walship::config {

using walship::util::ConfigError;

namespace {

bool SamePath(const std::string& a, const std::string& b) {
  return std::filesystem::path(a).lexically_normal() == std::filesystem::path(b).lexically_normal();
}

} // namespace

void Validate(const walship::runtime::config::RuntimeConfig& config) {
  if (config.mount_dir().empty()) {
    throw ConfigError("mount directory required");
  }
  if (config.data_dir().empty()) {
    throw ConfigError("data directory required");
  }
  if (SamePath(config.mount_dir(), config.data_dir())) {
    throw ConfigError("mount directory and data directory cannot be the same path");
  }

  // exactly one lease mode
  if (config.has_static_() && config.has_coordinated()) {
    throw ConfigError("cannot specify both 'coordinated' and 'static' lease modes");
  }
  if (!config.has_static_() && !config.has_coordinated()) {
    throw ConfigError("must specify a lease mode ('coordinated', 'static')");
  }

  if (config.has_static_() && !config.static_().primary() && config.static_().advertise_url().empty()) {
    throw ConfigError("static lease mode requires the primary's advertise_url on replicas");
  }

  if (config.has_coordinated()) {
    const auto& coordinated = config.coordinated();
    const auto  ttl         = walship::util::FromProto(coordinated.ttl());
    const auto  renew       = walship::util::FromProto(coordinated.renew_interval());
    if (ttl <= walship::util::Duration::zero()) {
      throw ConfigError("coordinated.ttl must be positive");
    }
    if (renew >= ttl) {
      throw ConfigError("coordinated.renew_interval must be shorter than coordinated.ttl");
    }
    if (coordinated.has_postgres() && coordinated.postgres().connection_uri().empty()) {
      throw ConfigError("coordinated.postgres.connection_uri required");
    }
  }

  if (config.replication().reconnect_backoff_min().seconds() < 0 || config.replication().reconnect_backoff_max().seconds() < 0) {
    throw ConfigError("replication backoff must not be negative");
  }

  if (config.storage().has_sqlite()) {
    if (config.storage().sqlite().path().empty()) {
      throw ConfigError("storage.sqlite.path required");
    }
    const auto& sync = config.storage().sqlite().synchronous();
    if (!sync.empty() && sync != "NORMAL" && sync != "FULL") {
      throw ConfigError("storage.sqlite.synchronous must be NORMAL or FULL, got " + sync);
    }
  }
}

} // namespace walship::config
