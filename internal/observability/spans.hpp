#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace epd::runtime::config {
class RuntimeConfig;
}

namespace epd::observability {

// Which OTLP exporters InitializeTelemetry started.
struct TelemetryExport {
  bool traces  = false;
  bool metrics = false;
};

/*
  Starts the trace and metric exporters the observability section enables.
  Calling it again replaces running exporters. Builds without ENABLE_OTEL
  export nothing.
*/
TelemetryExport InitializeTelemetry(const epd::runtime::config::RuntimeConfig& config);
// Flushes and stops both exporters.
void ShutdownTelemetry();

/*
  One span per RPC, active for the lifetime of the scope. The Tag* setters
  attach the request's device, asset kind and payload size under the
  epd.* attribute keys. Without ENABLE_OTEL every member is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view route);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  // epd.device, as sent by the caller; it may not be a valid address.
  void TagDevice(std::string_view device);
  // epd.asset_kind
  void TagAssetKind(std::string_view kind);
  // epd.bytes: bytes streamed out, or preview bytes written.
  void TagByteCount(std::uint64_t bytes);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveRenderDurationMs(double duration_ms);
  void AddBytesServed(std::string_view asset_kind, std::uint64_t bytes);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline TelemetryExport InitializeTelemetry(const epd::runtime::config::RuntimeConfig&) {
  return {};
}

inline void ShutdownTelemetry() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::TagDevice(std::string_view) {
}

inline void SpanScope::TagAssetKind(std::string_view) {
}

inline void SpanScope::TagByteCount(std::uint64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
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

inline void Metrics::ObserveRenderDurationMs(double) {
}

inline void Metrics::AddBytesServed(std::string_view, std::uint64_t) {
}
#endif

} // namespace epd::observability
