#pragma once

#include <memory>

namespace walship::store { class Store; }
namespace walship::observability { class StatusRegistry; }

namespace walship::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<walship::store::Store> store;
  std::shared_ptr<walship::observability::StatusRegistry> status;
};

}
