#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/database_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/replication_server.hpp"
#include "internal/lease/static_leaser.hpp"
#include "internal/service/database_service.hpp"
#include "internal/service/replication_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/store.hpp"
#include "walship/v1.hpp"

namespace {

using namespace std::chrono_literals;

walship::service::ServiceContext BuildServiceContext(bool primary) {
  const walship::lease::Node a{"a", "http://a:20202", true};
  const walship::lease::Node b{"b", "http://b:20202", false};

  walship::store::StoreOptions options;
  options.candidate = primary;

  walship::service::ServiceContext ctx;
  ctx.store = std::make_shared<walship::store::Store>(
      options, std::make_shared<walship::lease::StaticLeaser>(primary, primary ? a : b, a),
      std::make_shared<walship::store::DatabaseRegistry>(std::make_shared<walship::db::memory::MemoryRepository>()), nullptr);
  if (primary) {
    ctx.store->Open();
    assert(ctx.store->Ready().WaitFor(5s));
  }
  return ctx;
}

void TestCommitOnReplicaReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext(false);
  walship::grpc::DatabaseServer server(std::make_shared<walship::service::DatabaseService>(ctx));

  walship::services::v1::CommitRequest req;
  req.set_database("app.db");
  auto* page = req.mutable_frame()->add_pages();
  page->set_pgno(1);
  page->set_data("x");
  walship::services::v1::CommitResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = server.Commit(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestCommitWithoutFrameReturnsInvalidArgument() {
  auto ctx = BuildServiceContext(true);
  walship::grpc::DatabaseServer server(std::make_shared<walship::service::DatabaseService>(ctx));

  walship::services::v1::CommitRequest req;
  req.set_database("app.db");
  walship::services::v1::CommitResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = server.Commit(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestPositionOfUnknownDatabaseReturnsNotFound() {
  auto ctx = BuildServiceContext(true);
  walship::grpc::DatabaseServer server(std::make_shared<walship::service::DatabaseService>(ctx));

  walship::services::v1::GetPositionRequest req;
  req.set_database("missing.db");
  walship::services::v1::GetPositionResponse resp;
  ::grpc::ServerContext                      grpc_ctx;

  const auto status = server.GetPosition(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestSnapshotOnReplicaReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext(false);
  walship::grpc::ReplicationServer server(std::make_shared<walship::service::ReplicationService>(ctx, walship::service::StreamOptions{}));

  walship::services::v1::SnapshotRequest req;
  req.set_database("app.db");
  walship::services::v1::SnapshotResponse resp;
  ::grpc::ServerContext                   grpc_ctx;

  const auto status = server.Snapshot(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestAcknowledgeOfUnknownDatabaseReturnsNotFound() {
  auto ctx = BuildServiceContext(true);
  walship::grpc::ReplicationServer server(std::make_shared<walship::service::ReplicationService>(ctx, walship::service::StreamOptions{}));

  walship::services::v1::AcknowledgeRequest req;
  req.set_database("missing.db");
  req.set_node_id("b");
  walship::services::v1::AcknowledgeResponse resp;
  ::grpc::ServerContext                      grpc_ctx;

  const auto status = server.Acknowledge(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

template <typename Error>
void ExpectRoundTrip(const Error& error, ::grpc::StatusCode code) {
  const auto status = walship::grpc::ToStatus(error);
  assert(status.error_code() == code);
  assert(status.error_message() == error.what());

  bool matched = false;
  try {
    walship::grpc::ThrowIfError(status);
  } catch (const Error& e) {
    matched = std::string(e.what()) == error.what();
  }
  assert(matched);
}

void TestErrorMapping() {
  using namespace walship::util;

  ExpectRoundTrip(PositionTooOldError("old"), ::grpc::StatusCode::OUT_OF_RANGE);
  ExpectRoundTrip(DesyncError("gap"), ::grpc::StatusCode::DATA_LOSS);
  ExpectRoundTrip(NotPrimaryError("replica"), ::grpc::StatusCode::FAILED_PRECONDITION);
  ExpectRoundTrip(UnknownDatabaseError("missing"), ::grpc::StatusCode::NOT_FOUND);
  ExpectRoundTrip(InvalidArgument("bad"), ::grpc::StatusCode::INVALID_ARGUMENT);
  ExpectRoundTrip(ConnectionError("down"), ::grpc::StatusCode::UNAVAILABLE);
  ExpectRoundTrip(LeaseLostError("lost"), ::grpc::StatusCode::ABORTED);

  assert(walship::grpc::ToStatus(NoPrimaryError("none")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(walship::grpc::ToStatus(LeaseHeldError("held")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(walship::grpc::ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  bool connection = false;
  try {
    walship::grpc::ThrowIfError(::grpc::Status(::grpc::StatusCode::DEADLINE_EXCEEDED, "slow"));
  } catch (const ConnectionError&) {
    connection = true;
  }
  assert(connection);

  walship::grpc::ThrowIfError(::grpc::Status::OK);
}

} // namespace

int main() {
  TestCommitOnReplicaReturnsFailedPrecondition();
  TestCommitWithoutFrameReturnsInvalidArgument();
  TestPositionOfUnknownDatabaseReturnsNotFound();
  TestSnapshotOnReplicaReturnsFailedPrecondition();
  TestAcknowledgeOfUnknownDatabaseReturnsNotFound();
  TestErrorMapping();

  std::cout << "walship_unit_grpc_status: pass\n";
  return 0;
}
