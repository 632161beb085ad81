#include "database_server.hpp"

#include "grpc_error.hpp"
#include "walship/v1.hpp"

namespace walship::grpc {

DatabaseServer::DatabaseServer(std::shared_ptr<walship::service::DatabaseService> svc)
    : service_(std::move(svc)) {}

::grpc::Status DatabaseServer::Commit(::grpc::ServerContext*,
                                      const walship::services::v1::CommitRequest* req,
                                      walship::services::v1::CommitResponse* resp) {
  try {
    *resp = service_->Commit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatabaseServer::GetPosition(::grpc::ServerContext*,
                                           const walship::services::v1::GetPositionRequest* req,
                                           walship::services::v1::GetPositionResponse* resp) {
  try {
    *resp = service_->GetPosition(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace walship::grpc
