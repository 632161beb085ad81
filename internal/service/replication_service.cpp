#include "replication_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/store/store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "walship/v1.hpp"

namespace walship::service {

using namespace walship::v1;
using observability::IntField;
using observability::StringField;

ReplicationService::ReplicationService(ServiceContext ctx, StreamOptions options) : ctx_(std::move(ctx)), options_(options) {
}

GetPrimaryStateResponse ReplicationService::GetPrimaryState(const GetPrimaryStateRequest&) {
  return ObserveRpc("ReplicationService.GetPrimaryState", "", [&] {
    ctx_.store->CheckPrimary();

    GetPrimaryStateResponse resp;
    const auto&             self = ctx_.store->Self();
    resp.mutable_node()->set_hostname(self.hostname);
    resp.mutable_node()->set_advertise_url(self.advertise_url);
    resp.mutable_node()->set_candidate(self.candidate);

    for (const auto& db : ctx_.store->Registry()->List()) {
      auto* entry = resp.add_databases();
      entry->set_name(db->Name());
      *entry->mutable_position() = store::ToProto(db->CurrentPosition());
    }
    return resp;
  });
}

void ReplicationService::Stream(const StreamRequest& req, const WriteFn& write, const CancelledFn& cancelled) {
  ObserveRpc("ReplicationService.Stream", req.database(), [&] {
    auto session = ctx_.store->OpenSession(req.database(), req.node_id(), store::FromProto(req.position()));

    struct CloseSession {
      const store::SessionHandle& handle;
      ~CloseSession() {
        handle.database->CloseSession(handle.id);
      }
    } close{session};

    WALSHIP_LOG_INFO("replica stream opened", {StringField("database", req.database()), StringField("node", req.node_id()),
                                               StringField("position", store::ToString(store::FromProto(req.position())))});

    while (!cancelled()) {
      store::Position current;
      auto frames = session.database->WaitFrames(session.id, options_.heartbeat_interval, options_.max_batch_frames, &current);
      if (cancelled()) break;

      if (frames.empty()) {
        StreamMessage msg;
        *msg.mutable_heartbeat()->mutable_position() = store::ToProto(current);
        if (!write(msg)) break;
        continue;
      }

      for (auto& frame : frames) {
        StreamMessage msg;
        *msg.mutable_frame()->mutable_position() = store::ToProto({current.generation, frame.txid()});
        *msg.mutable_frame()->mutable_frame()    = std::move(frame);
        if (!write(msg)) {
          WALSHIP_LOG_DEBUG("replica stream closed by peer", {StringField("database", req.database()), StringField("node", req.node_id())});
          return;
        }
      }

      const store::Position sent{current.generation, frames.back().txid()};
      session.database->AdvanceSession(session.id, sent);
      observability::Metrics::Instance().RecordFramesStreamed(req.database(), frames.size());
    }

    WALSHIP_LOG_DEBUG("replica stream finished", {StringField("database", req.database()), StringField("node", req.node_id())});
  });
}

SnapshotResponse ReplicationService::Snapshot(const SnapshotRequest& req) {
  return ObserveRpc("ReplicationService.Snapshot", req.database(), [&] {
    ctx_.store->CheckPrimary();

    auto db = ctx_.store->Registry()->Get(req.database());
    if (!db) {
      throw util::UnknownDatabaseError("unknown database " + req.database());
    }

    const auto snapshot = db->GetSnapshot();

    SnapshotResponse resp;
    resp.set_database(req.database());
    *resp.mutable_position() = store::ToProto(snapshot.position);
    resp.set_page_count(snapshot.page_count);
    for (const auto& page : snapshot.pages) {
      auto* out = resp.add_pages();
      out->set_pgno(page.pgno);
      out->set_data(page.data);
    }

    WALSHIP_LOG_INFO("snapshot served", {StringField("database", req.database()), StringField("position", store::ToString(snapshot.position)),
                                         IntField("pages", static_cast<int64_t>(snapshot.pages.size()))});
    return resp;
  });
}

AcknowledgeResponse ReplicationService::Acknowledge(const AcknowledgeRequest& req) {
  return ObserveRpc("ReplicationService.Acknowledge", req.database(), [&] {
    ctx_.store->CheckPrimary();

    auto db = ctx_.store->Registry()->Get(req.database());
    if (!db) {
      throw util::UnknownDatabaseError("unknown database " + req.database());
    }
    db->Acknowledge(req.node_id(), store::FromProto(req.position()));
    return AcknowledgeResponse{};
  });
}

} // namespace walship::service
