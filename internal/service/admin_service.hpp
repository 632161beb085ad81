#pragma once

#include "service_context.hpp"
#include "walship/services/v1/admin_service.pb.h"

namespace walship::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  walship::services::v1::InfoResponse
  Info(const walship::services::v1::InfoRequest& req);

private:
  ServiceContext ctx_;
};

}
