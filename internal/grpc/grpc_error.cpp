#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace walship::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace walship::util;

  if (dynamic_cast<const ConnectionError*>(&e) || dynamic_cast<const NoPrimaryError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const LeaseHeldError*>(&e) || dynamic_cast<const LeaseLostError*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const PositionTooOldError*>(&e)) {
    return {::grpc::StatusCode::OUT_OF_RANGE, e.what()};
  }
  if (dynamic_cast<const DesyncError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }
  if (dynamic_cast<const NotPrimaryError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const UnknownDatabaseError*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status) {
  using namespace walship::util;

  const auto& msg = status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::OK:
      return;
    case ::grpc::StatusCode::OUT_OF_RANGE:
      throw PositionTooOldError(msg);
    case ::grpc::StatusCode::DATA_LOSS:
      throw DesyncError(msg);
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      throw NotPrimaryError(msg);
    case ::grpc::StatusCode::NOT_FOUND:
      throw UnknownDatabaseError(msg);
    case ::grpc::StatusCode::ALREADY_EXISTS:
      throw AlreadyExists(msg);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      throw InvalidArgument(msg);
    case ::grpc::StatusCode::ABORTED:
      throw LeaseLostError(msg);
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::CANCELLED:
      throw ConnectionError(msg);
    default:
      throw std::runtime_error("rpc failed (" + std::to_string(static_cast<int>(status.error_code())) + "): " + msg);
  }
}

} // namespace walship::grpc
