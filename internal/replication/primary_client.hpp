#pragma once

#include <memory>
#include <string>

#include "internal/store/position.hpp"
#include "walship/services/v1/replication_service.pb.h"

namespace walship::replication {

/*
  One server stream of frames from the primary.

  Next() blocks for the next message and returns false once the stream ended
  cleanly. A stream that ends with an error throws the mapped util error
  (PositionTooOldError, NotPrimaryError, ConnectionError, ...).
*/
class FrameStream {
 public:
  virtual ~FrameStream() = default;

  virtual bool Next(walship::services::v1::StreamMessage* msg) = 0;

  // Unblocks a pending Next(); safe from any thread.
  virtual void Cancel() = 0;
};

// Consumer-side view of a primary's ReplicationService.
class PrimaryClient {
 public:
  virtual ~PrimaryClient() = default;

  virtual walship::services::v1::GetPrimaryStateResponse GetPrimaryState() = 0;

  virtual std::shared_ptr<FrameStream> OpenStream(const std::string& database, const store::Position& resume, const std::string& node_id) = 0;

  virtual walship::services::v1::SnapshotResponse Snapshot(const std::string& database) = 0;

  virtual void Acknowledge(const std::string& database, const store::Position& applied, const std::string& node_id) = 0;
};

class PrimaryClientFactory {
 public:
  virtual ~PrimaryClientFactory() = default;

  // Throws ConnectionError if `url` cannot be dialled.
  virtual std::shared_ptr<PrimaryClient> Connect(const std::string& url) = 0;
};

} // namespace walship::replication
