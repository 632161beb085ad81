#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/lease/leaser.hpp"

namespace walship::store {
class Store;
}
namespace walship::retention {
class RetentionMonitor;
}
namespace walship::observability {
class StatusRegistry;
}

namespace walship::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>>           grpc_services;
  std::shared_ptr<walship::store::Store>                  store;
  std::shared_ptr<walship::retention::RetentionMonitor>   retention;
  std::shared_ptr<walship::observability::StatusRegistry> status;
};

/*
  Build

  Constructs the entire node based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete leaser and repository types.
*/
Application Build(const walship::runtime::config::RuntimeConfig& config);

// This node as seen by the leaser. The advertise URL falls back to
// http://<hostname>:<bind port>.
lease::Node SelfNode(const walship::runtime::config::RuntimeConfig& config);

std::shared_ptr<lease::Leaser> BuildLeaser(const walship::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const walship::runtime::config::RuntimeConfig& config);

} // namespace walship::factory
