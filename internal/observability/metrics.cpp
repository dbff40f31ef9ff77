#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace shopstack::observability {
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

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      stage_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> execution_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::mutex                                    queue_depth_mutex;
  std::unordered_map<std::string, std::int64_t> queue_depths;
};

bool InitializeMetrics(const shopstack::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == shopstack::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  auto res   = resource::Resource::Create({{"service.name", otlp_config.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  g_provider->AddMetricReader(std::move(reader));

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
  impl_->meter  = provider->GetMeter("shopstack", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("shopstack.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("shopstack.request.latency_ms", "Request latency in milliseconds", "ms");
  impl_->stage_duration_ms  = impl_->meter->CreateDoubleHistogram("shopstack.pipeline.stage_duration_ms", "Pipeline stage duration", "ms");
  impl_->execution_outcomes = impl_->meter->CreateUInt64Counter("shopstack.pipeline.executions", "Terminal executions by outcome", "1");
  impl_->queue_depth_gauge  = impl_->meter->CreateInt64ObservableGauge("shopstack.pipeline.queue_depth", "Queued executions", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [pipeline, depth] : impl->queue_depths) {
          const std::initializer_list<AttributePair> attributes = {{"pipeline", pipeline}};
          int_result->Observe(depth, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  impl_->request_count->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveStageDurationMs(std::string_view stage, double duration_ms) {
  const std::initializer_list<AttributePair> attributes = {{"stage", std::string(stage)}};
  impl_->stage_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordExecutionOutcome(std::string_view pipeline, std::string_view outcome) {
  const std::initializer_list<AttributePair> attributes = {{"pipeline", std::string(pipeline)}, {"outcome", std::string(outcome)}};
  impl_->execution_outcomes->Add(1, attributes);
}

void Metrics::SetQueueDepth(std::string_view pipeline, std::uint64_t depth) {
  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depths[std::string(pipeline)] = static_cast<std::int64_t>(depth);
}

} // namespace shopstack::observability

#endif
