#pragma once

#include <memory>
#include <string>

#include <grpcpp/channel.h>

#include "internal/replication/primary_client.hpp"
#include "internal/util/time.hpp"
#include "walship/services/v1/replication_service.grpc.pb.h"

namespace walship::grpc {

// "http://host:port" or "host:port" -> "host:port"
std::string ChannelTarget(const std::string& advertise_url);

/*
  PrimaryClient over a gRPC channel to the primary's ReplicationService.

  Unary calls carry a deadline; streams do not. Non-OK statuses are thrown
  as the matching util error.
*/
class GrpcPrimaryClient final : public replication::PrimaryClient {
 public:
  GrpcPrimaryClient(std::shared_ptr<::grpc::Channel> channel, util::Duration rpc_timeout);

  walship::services::v1::GetPrimaryStateResponse GetPrimaryState() override;

  std::shared_ptr<replication::FrameStream> OpenStream(const std::string& database, const store::Position& resume, const std::string& node_id) override;

  walship::services::v1::SnapshotResponse Snapshot(const std::string& database) override;

  void Acknowledge(const std::string& database, const store::Position& applied, const std::string& node_id) override;

 private:
  std::unique_ptr<walship::services::v1::ReplicationService::Stub> stub_;
  util::Duration                                                   rpc_timeout_;
};

class GrpcPrimaryClientFactory final : public replication::PrimaryClientFactory {
 public:
  explicit GrpcPrimaryClientFactory(util::Duration rpc_timeout = std::chrono::seconds(5));

  std::shared_ptr<replication::PrimaryClient> Connect(const std::string& url) override;

 private:
  util::Duration rpc_timeout_;
};

} // namespace walship::grpc
