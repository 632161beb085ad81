#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace walship::runtime::config {
class RuntimeConfig;
}

namespace walship::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"walship"};
  // hostname from the lease block; exported as service.instance.id
  std::string   instance_id{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

bool InitializeMetrics(const walship::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordCommit(std::string_view database);
  void RecordFramesApplied(std::string_view database, std::uint64_t count);
  void RecordFramesStreamed(std::string_view database, std::uint64_t count);
  void RecordFramesPruned(std::string_view database, std::uint64_t count);
  void RecordResync(std::string_view database);
  void RecordRoleTransition(std::string_view role);
  void RecordLeaseLost();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const walship::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordCommit(std::string_view) {
}

inline void Metrics::RecordFramesApplied(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordFramesStreamed(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordFramesPruned(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordResync(std::string_view) {
}

inline void Metrics::RecordRoleTransition(std::string_view) {
}

inline void Metrics::RecordLeaseLost() {
}
#endif

} // namespace walship::observability
