#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/replication_service.hpp"
#include "walship/services/v1/replication_service.grpc.pb.h"

namespace walship::grpc {

class ReplicationServer final : public walship::services::v1::ReplicationService::Service {
public:
  explicit ReplicationServer(std::shared_ptr<walship::service::ReplicationService> svc);

  ::grpc::Status GetPrimaryState(::grpc::ServerContext*,
                                 const walship::services::v1::GetPrimaryStateRequest*,
                                 walship::services::v1::GetPrimaryStateResponse*) override;

  ::grpc::Status Stream(::grpc::ServerContext*,
                        const walship::services::v1::StreamRequest*,
                        ::grpc::ServerWriter<walship::services::v1::StreamMessage>*) override;

  ::grpc::Status Snapshot(::grpc::ServerContext*,
                          const walship::services::v1::SnapshotRequest*,
                          walship::services::v1::SnapshotResponse*) override;

  ::grpc::Status Acknowledge(::grpc::ServerContext*,
                             const walship::services::v1::AcknowledgeRequest*,
                             walship::services::v1::AcknowledgeResponse*) override;

private:
  std::shared_ptr<walship::service::ReplicationService> service_;
};

} // namespace walship::grpc
