#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <optional>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/model/asset_kind.hpp"
#include "internal/util/device_address.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace epd::observability {
namespace {

constexpr const char* kLoggerName     = "epd-server";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_trace_context{false};

std::string FirstSet(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

// spdlog maps unknown names to "off", which would silence the server.
std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (const char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& line, std::string_view value) {
  if (!NeedsQuoting(value)) {
    line.append(value);
    return;
  }
  line.push_back('"');
  for (const char c : value) {
    if (c == '"' || c == '\\') {
      line.push_back('\\');
      line.push_back(c);
    } else if (c == '\n') {
      line.append("\\n");
    } else {
      line.push_back(c);
    }
  }
  line.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& line, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    line.push_back(kHex[data[i] >> 4]);
    line.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& line) {
  if (!g_trace_context) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }

  uint8_t trace_id[16];
  uint8_t span_id[8];
  span->GetContext().trace_id().CopyBytesTo(trace_id);
  span->GetContext().span_id().CopyBytesTo(span_id);

  line.append(" trace_id=");
  AppendHex(line, trace_id, sizeof(trace_id));
  line.append(" span_id=");
  AppendHex(line, span_id, sizeof(span_id));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DeviceField(const epd::util::DeviceAddress& address) {
  return {"device", address.ToString()};
}

LogField KindField(epd::model::AssetKind kind) {
  return {"kind", std::string(epd::model::ToString(kind))};
}

void InitializeLogging(const epd::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }

  const auto level_name = FirstSet("EPD_LOG_LEVEL", config.logging().level(), "info");
  const auto level      = ParseLevel(level_name);

  logger->set_pattern(FirstSet("EPD_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(level.value_or(spdlog::level::info));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_trace_context = config.logging().include_trace_context();

  if (!level) {
    Log(spdlog::level::warn, "unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);
  return line;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }
  spdlog::log(level, "{}", FormatLine(message, fields));
}

} // namespace epd::observability
