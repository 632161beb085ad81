#include "grpc_primary_client.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/sync_stream.h>

#include "grpc_error.hpp"
#include "internal/util/errors.hpp"
#include "walship/v1.hpp"

namespace walship::grpc {

using namespace walship::v1;

namespace {

class GrpcFrameStream final : public replication::FrameStream {
 public:
  GrpcFrameStream(walship::services::v1::ReplicationService::Stub& stub, const StreamRequest& req)
      : context_(std::make_unique<::grpc::ClientContext>()) {
    reader_ = stub.Stream(context_.get(), req);
  }

  ~GrpcFrameStream() override {
    if (finished_) return;
    // abandoned mid-stream; the status of a cancelled call carries nothing
    context_->TryCancel();
    reader_->Finish();
  }

  bool Next(StreamMessage* msg) override {
    if (reader_->Read(msg)) return true;
    finished_ = true;
    ThrowIfError(reader_->Finish());
    return false;
  }

  void Cancel() override {
    context_->TryCancel();
  }

 private:
  std::unique_ptr<::grpc::ClientContext>               context_;
  std::unique_ptr<::grpc::ClientReader<StreamMessage>> reader_;
  bool                                                 finished_ = false;
};

void SetDeadline(::grpc::ClientContext& ctx, util::Duration timeout) {
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
}

} // namespace

std::string ChannelTarget(const std::string& advertise_url) {
  for (const char* scheme : {"http://", "https://", "grpc://"}) {
    const std::string prefix(scheme);
    if (advertise_url.rfind(prefix, 0) == 0) {
      auto target = advertise_url.substr(prefix.size());
      if (!target.empty() && target.back() == '/') target.pop_back();
      return target;
    }
  }
  return advertise_url;
}

GrpcPrimaryClient::GrpcPrimaryClient(std::shared_ptr<::grpc::Channel> channel, util::Duration rpc_timeout)
    : stub_(walship::services::v1::ReplicationService::NewStub(std::move(channel))), rpc_timeout_(rpc_timeout) {
}

GetPrimaryStateResponse GrpcPrimaryClient::GetPrimaryState() {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);

  GetPrimaryStateResponse resp;
  ThrowIfError(stub_->GetPrimaryState(&ctx, GetPrimaryStateRequest{}, &resp));
  return resp;
}

std::shared_ptr<replication::FrameStream> GrpcPrimaryClient::OpenStream(const std::string& database, const store::Position& resume,
                                                                        const std::string& node_id) {
  StreamRequest req;
  req.set_database(database);
  *req.mutable_position() = store::ToProto(resume);
  req.set_node_id(node_id);
  return std::make_shared<GrpcFrameStream>(*stub_, req);
}

SnapshotResponse GrpcPrimaryClient::Snapshot(const std::string& database) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_ * 6);

  SnapshotRequest req;
  req.set_database(database);

  SnapshotResponse resp;
  ThrowIfError(stub_->Snapshot(&ctx, req, &resp));
  return resp;
}

void GrpcPrimaryClient::Acknowledge(const std::string& database, const store::Position& applied, const std::string& node_id) {
  ::grpc::ClientContext ctx;
  SetDeadline(ctx, rpc_timeout_);

  AcknowledgeRequest req;
  req.set_database(database);
  req.set_node_id(node_id);
  *req.mutable_position() = store::ToProto(applied);

  AcknowledgeResponse resp;
  ThrowIfError(stub_->Acknowledge(&ctx, req, &resp));
}

GrpcPrimaryClientFactory::GrpcPrimaryClientFactory(util::Duration rpc_timeout) : rpc_timeout_(rpc_timeout) {
}

std::shared_ptr<replication::PrimaryClient> GrpcPrimaryClientFactory::Connect(const std::string& url) {
  const auto target = ChannelTarget(url);
  if (target.empty()) {
    throw util::ConnectionError("primary has no advertise url");
  }

  ::grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(-1);
  auto channel = ::grpc::CreateCustomChannel(target, ::grpc::InsecureChannelCredentials(), args);
  return std::make_shared<GrpcPrimaryClient>(std::move(channel), rpc_timeout_);
}

} // namespace walship::grpc
