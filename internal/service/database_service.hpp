#pragma once

#include "service_context.hpp"
#include "walship/services/v1/database_service.pb.h"

namespace walship::service {

// Commit admission for the filesystem layer.
class DatabaseService {
 public:
  explicit DatabaseService(ServiceContext ctx);

  walship::services::v1::CommitResponse Commit(const walship::services::v1::CommitRequest& req);

  walship::services::v1::GetPositionResponse GetPosition(const walship::services::v1::GetPositionRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace walship::service
