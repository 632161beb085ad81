#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "walship/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace walship::grpc {

class AdminServer final : public walship::services::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<walship::service::AdminService> svc);

  ::grpc::Status Info(::grpc::ServerContext*,
                      const walship::services::v1::InfoRequest*,
                      walship::services::v1::InfoResponse*) override;

private:
  std::shared_ptr<walship::service::AdminService> service_;
};

}
