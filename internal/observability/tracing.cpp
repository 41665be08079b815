#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_common.hpp"

namespace epd::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

constexpr const char* kDeviceKey    = "epd.device";
constexpr const char* kAssetKindKey = "epd.asset_kind";
constexpr const char* kBytesKey     = "epd.bytes";

struct TracingState {
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracingState g_tracing;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const detail::OtlpConfig& config) {
  const auto endpoint = detail::ResolveEndpoint(config, "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "/v1/traces");
  if (config.transport == detail::OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool detail::StartTracingExport(const epd::runtime::config::RuntimeConfig& config) {
  StopTracingExport();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  const auto otlp_config = detail::FromRuntimeConfig(config);
  auto       processor   = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});

  g_tracing.provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), detail::BuildResource(otlp_config)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracing.provider));
  g_tracing.tracer = g_tracing.provider->GetTracer("epd-server", "0.1.0");
  return static_cast<bool>(g_tracing.tracer);
}

void detail::StopTracingExport() {
  if (g_tracing.provider) {
    g_tracing.provider->ForceFlush();
    g_tracing.provider->Shutdown();
  }
  g_tracing = TracingState{};
}

TelemetryExport InitializeTelemetry(const epd::runtime::config::RuntimeConfig& config) {
  TelemetryExport started;
  started.traces  = detail::StartTracingExport(config);
  started.metrics = detail::StartMetricsExport(config);
  return started;
}

void ShutdownTelemetry() {
  detail::StopMetricsExport();
  detail::StopTracingExport();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  bool active() const {
    return static_cast<bool>(span);
  }
};

SpanScope::SpanScope(std::string_view route) : impl_(std::make_unique<Impl>()) {
  if (!g_tracing.tracer) {
    return;
  }

  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kServer;
  impl_->span  = g_tracing.tracer->StartSpan(std::string(route), options);
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracing.tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->active()) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::TagDevice(std::string_view device) {
  if (impl_ && impl_->active()) {
    impl_->span->SetAttribute(kDeviceKey, std::string(device));
  }
}

void SpanScope::TagAssetKind(std::string_view kind) {
  if (impl_ && impl_->active()) {
    impl_->span->SetAttribute(kAssetKindKey, std::string(kind));
  }
}

void SpanScope::TagByteCount(std::uint64_t bytes) {
  if (impl_ && impl_->active()) {
    impl_->span->SetAttribute(kBytesKey, static_cast<int64_t>(bytes));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->active()) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace epd::observability

#endif
