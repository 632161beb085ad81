#include "replication_server.hpp"

#include "grpc_error.hpp"
#include "walship/v1.hpp"

namespace walship::grpc {

ReplicationServer::ReplicationServer(std::shared_ptr<walship::service::ReplicationService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ReplicationServer::GetPrimaryState(::grpc::ServerContext*,
                                                  const walship::services::v1::GetPrimaryStateRequest* req,
                                                  walship::services::v1::GetPrimaryStateResponse* resp) {
  try {
    *resp = service_->GetPrimaryState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReplicationServer::Stream(::grpc::ServerContext* ctx,
                                         const walship::services::v1::StreamRequest* req,
                                         ::grpc::ServerWriter<walship::services::v1::StreamMessage>* writer) {
  try {
    service_->Stream(
        *req,
        [writer](const walship::services::v1::StreamMessage& msg) { return writer->Write(msg); },
        [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReplicationServer::Snapshot(::grpc::ServerContext*,
                                           const walship::services::v1::SnapshotRequest* req,
                                           walship::services::v1::SnapshotResponse* resp) {
  try {
    *resp = service_->Snapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReplicationServer::Acknowledge(::grpc::ServerContext*,
                                              const walship::services::v1::AcknowledgeRequest* req,
                                              walship::services::v1::AcknowledgeResponse* resp) {
  try {
    *resp = service_->Acknowledge(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace walship::grpc
