#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/database_service.hpp"
#include "walship/services/v1/database_service.grpc.pb.h"

namespace walship::grpc {

class DatabaseServer final : public walship::services::v1::DatabaseService::Service {
public:
  explicit DatabaseServer(std::shared_ptr<walship::service::DatabaseService> svc);

  ::grpc::Status Commit(::grpc::ServerContext*,
                        const walship::services::v1::CommitRequest*,
                        walship::services::v1::CommitResponse*) override;

  ::grpc::Status GetPosition(::grpc::ServerContext*,
                             const walship::services::v1::GetPositionRequest*,
                             walship::services::v1::GetPositionResponse*) override;

private:
  std::shared_ptr<walship::service::DatabaseService> service_;
};

} // namespace walship::grpc
