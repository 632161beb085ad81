#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define WALSHIP_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define WALSHIP_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace walship::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  if (!config.instance_id.empty()) {
    attrs.SetAttribute("service.instance.id", opentelemetry::nostd::string_view(config.instance_id));
  }
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> commit_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> frames_applied;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> frames_streamed;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> frames_pruned;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> resync_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> role_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> leases_lost;
};

bool InitializeMetrics(const walship::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint    = observability.otlp_endpoint();
  otlp_config.instance_id = config.has_coordinated() ? config.coordinated().hostname() : config.static_().hostname();
  otlp_config.transport =
      observability.transport() == walship::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.collection_interval_ms() > 0) {
    otlp_config.collection_interval_ms = observability.collection_interval_ms();
  }

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.collection_interval_ms);

#ifdef WALSHIP_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(otlp_config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("walship", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("walship.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("walship.request.latency_ms", "ms", "Request latency in milliseconds");
  impl_->commit_count       = impl_->meter->CreateUInt64Counter("walship.commit.count", "1", "Frames committed on the primary");
  impl_->frames_applied     = impl_->meter->CreateUInt64Counter("walship.frames.applied", "1", "Frames applied by the replica");
  impl_->frames_streamed    = impl_->meter->CreateUInt64Counter("walship.frames.streamed", "1", "Frames sent to replicas");
  impl_->frames_pruned      = impl_->meter->CreateUInt64Counter("walship.frames.pruned", "1", "Frames removed by retention");
  impl_->resync_count       = impl_->meter->CreateUInt64Counter("walship.resync.count", "1", "Full snapshot resyncs");
  impl_->role_transitions   = impl_->meter->CreateUInt64Counter("walship.role.transitions", "1", "Store role transitions");
  impl_->leases_lost        = impl_->meter->CreateUInt64Counter("walship.lease.lost", "1", "Primary leases lost before release");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordCommit(std::string_view database) {
  const std::initializer_list<AttributePair> attributes = {{"database", std::string(database)}};
  AddWithAttributes(impl_->commit_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordFramesApplied(std::string_view database, std::uint64_t count) {
  const std::initializer_list<AttributePair> attributes = {{"database", std::string(database)}};
  AddWithAttributes(impl_->frames_applied, count, attributes);
}

void Metrics::RecordFramesStreamed(std::string_view database, std::uint64_t count) {
  const std::initializer_list<AttributePair> attributes = {{"database", std::string(database)}};
  AddWithAttributes(impl_->frames_streamed, count, attributes);
}

void Metrics::RecordFramesPruned(std::string_view database, std::uint64_t count) {
  const std::initializer_list<AttributePair> attributes = {{"database", std::string(database)}};
  AddWithAttributes(impl_->frames_pruned, count, attributes);
}

void Metrics::RecordResync(std::string_view database) {
  const std::initializer_list<AttributePair> attributes = {{"database", std::string(database)}};
  AddWithAttributes(impl_->resync_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRoleTransition(std::string_view role) {
  const std::initializer_list<AttributePair> attributes = {{"role", std::string(role)}};
  AddWithAttributes(impl_->role_transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordLeaseLost() {
  impl_->leases_lost->Add(1);
}

} // namespace walship::observability

#endif
