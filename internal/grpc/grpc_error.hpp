#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace walship::grpc {

/*
  Converts internal exceptions into gRPC status codes and back.
*/

::grpc::Status ToStatus(const std::exception& e);

// Throws the util error matching `status`. No-op for OK.
void ThrowIfError(const ::grpc::Status& status);

} // namespace walship::grpc
