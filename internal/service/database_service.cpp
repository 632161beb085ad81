#include "database_service.hpp"

#include "internal/store/store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "walship/v1.hpp"

namespace walship::service {

using namespace walship::v1;

DatabaseService::DatabaseService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CommitResponse DatabaseService::Commit(const CommitRequest& req) {
  return ObserveRpc("DatabaseService.Commit", req.database(), [&] {
    if (req.database().empty()) {
      throw util::InvalidArgument("database is required");
    }
    if (!req.has_frame()) {
      throw util::InvalidArgument("frame is required");
    }

    CommitResponse resp;
    *resp.mutable_position() = store::ToProto(ctx_.store->Commit(req.database(), req.frame()));
    return resp;
  });
}

GetPositionResponse DatabaseService::GetPosition(const GetPositionRequest& req) {
  return ObserveRpc("DatabaseService.GetPosition", req.database(), [&] {
    GetPositionResponse resp;
    *resp.mutable_position() = store::ToProto(ctx_.store->GetPosition(req.database()));
    return resp;
  });
}

} // namespace walship::service
