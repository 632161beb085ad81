#pragma once

#include <cstdint>
#include <functional>

#include "internal/util/time.hpp"
#include "service_context.hpp"
#include "walship/services/v1/replication_service.pb.h"

namespace walship::service {

struct StreamOptions {
  util::Duration heartbeat_interval{1000};
  uint32_t       max_batch_frames = 64;
};

/*
  Producer side of replication, served by the primary.
*/
class ReplicationService {
 public:
  // Returns false once the peer is gone.
  using WriteFn     = std::function<bool(const walship::services::v1::StreamMessage&)>;
  using CancelledFn = std::function<bool()>;

  ReplicationService(ServiceContext ctx, StreamOptions options);

  walship::services::v1::GetPrimaryStateResponse GetPrimaryState(const walship::services::v1::GetPrimaryStateRequest& req);

  // Blocks until the peer goes away, the call is cancelled or this node
  // stops being primary (NotPrimaryError).
  void Stream(const walship::services::v1::StreamRequest& req, const WriteFn& write, const CancelledFn& cancelled);

  walship::services::v1::SnapshotResponse Snapshot(const walship::services::v1::SnapshotRequest& req);

  // Replica reports its applied position; retention keeps frames after it.
  walship::services::v1::AcknowledgeResponse Acknowledge(const walship::services::v1::AcknowledgeRequest& req);

 private:
  ServiceContext ctx_;
  StreamOptions  options_;
};

} // namespace walship::service
