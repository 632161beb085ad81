#include "tests/support/in_process_primary.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <thread>

#include "internal/util/errors.hpp"

namespace walship::testing {

using walship::services::v1::StreamMessage;

namespace {

// Runs ReplicationService::Stream on its own thread, like a gRPC server call.
class InProcessStream final : public replication::FrameStream {
 public:
  InProcessStream(std::shared_ptr<service::ReplicationService> service, walship::services::v1::StreamRequest req) {
    thread_ = std::thread([this, service = std::move(service), req = std::move(req)] {
      try {
        service->Stream(
            req,
            [this](const StreamMessage& msg) {
              std::lock_guard lock(mutex_);
              if (cancelled_) return false;
              queue_.push_back(msg);
              cv_.notify_all();
              return true;
            },
            [this] { return cancelled_.load(); });
      } catch (const std::exception&) {
        std::lock_guard lock(mutex_);
        error_ = std::current_exception();
      }
      std::lock_guard lock(mutex_);
      done_ = true;
      cv_.notify_all();
    });
  }

  ~InProcessStream() override {
    Cancel();
    if (thread_.joinable()) thread_.join();
  }

  bool Next(StreamMessage* msg) override {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return !queue_.empty() || done_ || cancelled_; });

    if (!queue_.empty()) {
      *msg = std::move(queue_.front());
      queue_.pop_front();
      return true;
    }
    if (cancelled_) {
      throw util::ConnectionError("stream cancelled");
    }
    if (error_) {
      std::rethrow_exception(error_);
    }
    return false;
  }

  void Cancel() override {
    {
      std::lock_guard lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex                mutex_;
  std::condition_variable   cv_;
  std::deque<StreamMessage> queue_;
  std::atomic<bool>         cancelled_{false};
  bool                      done_ = false;
  std::exception_ptr        error_;
  std::thread               thread_;
};

class InProcessClient final : public replication::PrimaryClient {
 public:
  InProcessClient(std::shared_ptr<const InProcessNetwork> network, std::string url) : network_(std::move(network)), url_(std::move(url)) {
  }

  walship::services::v1::GetPrimaryStateResponse GetPrimaryState() override {
    return network_->Lookup(url_)->GetPrimaryState({});
  }

  std::shared_ptr<replication::FrameStream> OpenStream(const std::string& database, const store::Position& resume, const std::string& node_id) override {
    walship::services::v1::StreamRequest req;
    req.set_database(database);
    *req.mutable_position() = store::ToProto(resume);
    req.set_node_id(node_id);
    return std::make_shared<InProcessStream>(network_->Lookup(url_), std::move(req));
  }

  walship::services::v1::SnapshotResponse Snapshot(const std::string& database) override {
    walship::services::v1::SnapshotRequest req;
    req.set_database(database);
    return network_->Lookup(url_)->Snapshot(req);
  }

  void Acknowledge(const std::string& database, const store::Position& applied, const std::string& node_id) override {
    walship::services::v1::AcknowledgeRequest req;
    req.set_database(database);
    req.set_node_id(node_id);
    *req.mutable_position() = store::ToProto(applied);
    network_->Lookup(url_)->Acknowledge(req);
  }

 private:
  std::shared_ptr<const InProcessNetwork> network_;
  std::string                             url_;
};

} // namespace

void InProcessNetwork::Register(const std::string& url, std::shared_ptr<service::ReplicationService> service) {
  std::lock_guard lock(mutex_);
  services_[url] = std::move(service);
}

void InProcessNetwork::Unregister(const std::string& url) {
  std::lock_guard lock(mutex_);
  services_.erase(url);
}

std::shared_ptr<service::ReplicationService> InProcessNetwork::Lookup(const std::string& url) const {
  std::lock_guard lock(mutex_);
  auto            it = services_.find(url);
  if (it == services_.end()) {
    throw util::ConnectionError("no route to " + url);
  }
  return it->second;
}

std::shared_ptr<replication::PrimaryClient> InProcessNetwork::Connect(const std::string& url) {
  Lookup(url);
  return std::make_shared<InProcessClient>(shared_from_this(), url);
}

void RecordingInvalidator::InvalidatePosition(const std::string& database, const store::Position& position) {
  std::lock_guard lock(mutex_);
  calls_.push_back({database, position});
}

std::vector<RecordingInvalidator::Call> RecordingInvalidator::Calls() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

} // namespace walship::testing
