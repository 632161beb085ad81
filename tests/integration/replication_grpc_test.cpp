#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/database_server.hpp"
#include "internal/grpc/grpc_primary_client.hpp"
#include "internal/grpc/replication_server.hpp"
#include "internal/lease/static_leaser.hpp"
#include "internal/observability/status_registry.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/database_service.hpp"
#include "internal/service/replication_service.hpp"
#include "internal/store/store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/in_process_primary.hpp"
#include "walship/v1.hpp"

namespace {

using namespace std::chrono_literals;
using walship::store::Role;
using walship::store::Store;

bool WaitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 10s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return pred();
}

std::shared_ptr<walship::store::DatabaseRegistry> MakeRegistry() {
  return std::make_shared<walship::store::DatabaseRegistry>(std::make_shared<walship::db::memory::MemoryRepository>());
}

walship::store::StoreOptions FastOptions(bool candidate) {
  walship::store::StoreOptions options;
  options.candidate      = candidate;
  options.renew_interval = 50ms;
  options.poll_interval  = 50ms;
  options.backoff_min    = 20ms;
  options.backoff_max    = 200ms;
  return options;
}

struct PrimaryNode {
  std::shared_ptr<Store>                    store;
  std::unique_ptr<walship::runtime::Server> server;
  std::string                               url;
};

PrimaryNode StartPrimary() {
  const walship::lease::Node self{"primary", "", true};

  PrimaryNode node;
  node.store = std::make_shared<Store>(FastOptions(true), std::make_shared<walship::lease::StaticLeaser>(true, self, self), MakeRegistry(), nullptr);

  walship::service::ServiceContext ctx;
  ctx.store  = node.store;
  ctx.status = std::make_shared<walship::observability::StatusRegistry>();
  ctx.status->Publish("store", [store = std::weak_ptr<Store>(node.store)] {
    auto locked = store.lock();
    return locked ? locked->StatusJson() : std::string("{}");
  });

  walship::service::StreamOptions stream;
  stream.heartbeat_interval = 50ms;

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<walship::grpc::ReplicationServer>(std::make_shared<walship::service::ReplicationService>(ctx, stream)));
  services.push_back(std::make_unique<walship::grpc::DatabaseServer>(std::make_shared<walship::service::DatabaseService>(ctx)));
  services.push_back(std::make_unique<walship::grpc::AdminServer>(std::make_shared<walship::service::AdminService>(ctx)));

  node.server = std::make_unique<walship::runtime::Server>("127.0.0.1:0", std::move(services));
  node.server->Start();
  node.url = "http://127.0.0.1:" + std::to_string(node.server->Port());

  node.store->Open();
  assert(node.store->Ready().WaitFor(5s));
  return node;
}

std::shared_ptr<::grpc::Channel> Dial(const std::string& url) {
  return ::grpc::CreateChannel(walship::grpc::ChannelTarget(url), ::grpc::InsecureChannelCredentials());
}

walship::services::v1::CommitResponse CommitOverGrpc(walship::services::v1::DatabaseService::Stub& stub, const std::string& database, uint32_t pgno,
                                                     const std::string& data) {
  walship::services::v1::CommitRequest req;
  req.set_database(database);
  auto* page = req.mutable_frame()->add_pages();
  page->set_pgno(pgno);
  page->set_data(data);

  walship::services::v1::CommitResponse resp;
  ::grpc::ClientContext                 ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + 5s);
  const auto status = stub.Commit(&ctx, req, &resp);
  walship::grpc::ThrowIfError(status);
  return resp;
}

void TestChannelTarget() {
  assert(walship::grpc::ChannelTarget("http://db-1:20202") == "db-1:20202");
  assert(walship::grpc::ChannelTarget("https://db-1:20202") == "db-1:20202");
  assert(walship::grpc::ChannelTarget("db-1:20202") == "db-1:20202");
}

void TestReplicaFollowsPrimaryOverGrpc() {
  auto primary = StartPrimary();
  auto stub    = walship::services::v1::DatabaseService::NewStub(Dial(primary.url));

  for (uint32_t i = 1; i <= 3; ++i) {
    CommitOverGrpc(*stub, "app.db", i, "page-" + std::to_string(i));
  }
  const auto target = primary.store->GetPosition("app.db");

  const walship::lease::Node self{"replica", "http://127.0.0.1:1", false};
  const walship::lease::Node leader{"primary", primary.url, true};

  auto invalidator = std::make_shared<walship::testing::RecordingInvalidator>();
  auto replica     = std::make_shared<Store>(FastOptions(false), std::make_shared<walship::lease::StaticLeaser>(false, self, leader), MakeRegistry(),
                                         std::make_shared<walship::grpc::GrpcPrimaryClientFactory>(2s));
  replica->SetInvalidator(invalidator);
  replica->Open();

  assert(replica->Ready().WaitFor(10s));
  assert(replica->CurrentRole() == Role::kReplica);
  assert(replica->GetPosition("app.db") == target);

  const auto next = CommitOverGrpc(*stub, "app.db", 1, "page-1b");
  assert(WaitUntil([&] { return replica->GetPosition("app.db") == walship::store::FromProto(next.position()); }));
  assert(WaitUntil([&] { return invalidator->Calls().size() == 4; }));

  const auto snapshot = replica->Registry()->Get("app.db")->GetSnapshot();
  assert(snapshot.pages.size() == 3);
  assert(snapshot.pages[0].data == "page-1b");

  // writes against the replica's store are refused
  bool refused = false;
  try {
    walship::core::v1::Frame frame;
    frame.add_pages()->set_pgno(1);
    replica->Commit("app.db", frame);
  } catch (const walship::util::NotPrimaryError&) {
    refused = true;
  }
  assert(refused);

  // primary status is rendered through AdminService
  auto                              admin = walship::services::v1::AdminService::NewStub(Dial(primary.url));
  walship::services::v1::InfoResponse info;
  ::grpc::ClientContext             ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + 5s);
  assert(admin->Info(&ctx, {}, &info).ok());
  assert(info.status().role() == walship::core::v1::ROLE_PRIMARY);
  assert(info.status().databases_size() == 1);
  assert(info.vars().at("store").find("ROLE_PRIMARY") != std::string::npos);

  replica->Close();
  primary.store->Close();
  primary.server->Stop();
}

void TestStreamErrorsMapToUtilErrors() {
  auto primary = StartPrimary();
  auto stub    = walship::services::v1::DatabaseService::NewStub(Dial(primary.url));
  CommitOverGrpc(*stub, "app.db", 1, "x");
  const auto position = primary.store->GetPosition("app.db");

  walship::grpc::GrpcPrimaryClientFactory factory(2s);
  auto                                    client = factory.Connect(primary.url);

  const auto state = client->GetPrimaryState();
  assert(state.node().hostname() == "primary");
  assert(state.databases_size() == 1);

  walship::services::v1::StreamMessage msg;

  auto ahead = client->OpenStream("app.db", {position.generation, position.txid + 5}, "c");
  bool too_old = false;
  try {
    ahead->Next(&msg);
  } catch (const walship::util::PositionTooOldError&) {
    too_old = true;
  }
  assert(too_old);

  auto missing = client->OpenStream("missing.db", {}, "c");
  bool unknown = false;
  try {
    missing->Next(&msg);
  } catch (const walship::util::UnknownDatabaseError&) {
    unknown = true;
  }
  assert(unknown);

  // a good stream delivers the frame, then heartbeats
  auto stream = client->OpenStream("app.db", {}, "c");
  assert(stream->Next(&msg));
  assert(msg.has_frame());
  assert(msg.frame().frame().txid() == 1);
  assert(stream->Next(&msg));
  assert(msg.has_heartbeat());
  stream->Cancel();

  const auto snapshot = client->Snapshot("app.db");
  assert(snapshot.page_count() == 1);
  assert(snapshot.pages(0).data() == "x");

  primary.store->Close();
  primary.server->Stop();
}

void TestUnreachablePrimaryIsConnectionError() {
  walship::grpc::GrpcPrimaryClientFactory factory(500ms);
  auto                                    client = factory.Connect("http://127.0.0.1:1");

  bool connection = false;
  try {
    client->GetPrimaryState();
  } catch (const walship::util::ConnectionError&) {
    connection = true;
  }
  assert(connection);
}

} // namespace

int main() {
  TestChannelTarget();
  TestReplicaFollowsPrimaryOverGrpc();
  TestStreamErrorsMapToUtilErrors();
  TestUnreachablePrimaryIsConnectionError();

  std::cout << "walship_integration_replication_grpc: pass\n";
  return 0;
}
