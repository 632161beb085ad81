#include "admin_service.hpp"

#include "internal/observability/status_registry.hpp"
#include "internal/store/store.hpp"
#include "observe_rpc.hpp"
#include "walship/v1.hpp"

namespace walship::service {

using namespace walship::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

InfoResponse AdminService::Info(const InfoRequest&) {
  return ObserveRpc("AdminService.Info", "", [&] {
    InfoResponse resp;
    *resp.mutable_status() = ctx_.store->Status();

    if (ctx_.status) {
      for (const auto& [name, value] : ctx_.status->Render()) {
        (*resp.mutable_vars())[name] = value;
      }
    }
    return resp;
  });
}

} // namespace walship::service
