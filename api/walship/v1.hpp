#pragma once

#include "walship/core/v1/types.pb.h"

#include "walship/services/v1/admin_service.pb.h"
#include "walship/services/v1/database_service.pb.h"
#include "walship/services/v1/replication_service.pb.h"

#include "walship/services/v1/admin_service.grpc.pb.h"
#include "walship/services/v1/database_service.grpc.pb.h"
#include "walship/services/v1/replication_service.grpc.pb.h"

namespace walship::v1 {
using namespace ::walship::core::v1;
using namespace ::walship::services::v1;
}
