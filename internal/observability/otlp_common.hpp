#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace epd::observability::detail {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"epd-server"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

// Each returns whether its exporter is now running; defined beside the
// signal they export.
bool StartTracingExport(const epd::runtime::config::RuntimeConfig& config);
void StopTracingExport();
bool StartMetricsExport(const epd::runtime::config::RuntimeConfig& config);
void StopMetricsExport();

inline OtlpConfig FromRuntimeConfig(const epd::runtime::config::RuntimeConfig& config) {
  OtlpConfig otlp;
  otlp.endpoint  = config.observability().otlp_endpoint();
  otlp.transport = config.observability().transport() == epd::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                   : OtlpTransport::kGrpc;
  return otlp;
}

// signal is "traces" or "metrics".
inline std::string ResolveEndpoint(const OtlpConfig& config, const char* signal_env, const char* http_path) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? std::string("http://localhost:4318") + http_path : "localhost:4317";
}

inline opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace epd::observability::detail

#endif
