#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "walship/v1.hpp"

namespace walship::grpc {

AdminServer::AdminServer(std::shared_ptr<walship::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Info(::grpc::ServerContext*, const walship::services::v1::InfoRequest* req, walship::services::v1::InfoResponse* resp) {
  try {
    *resp = service_->Info(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace walship::grpc
