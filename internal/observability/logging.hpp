#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace epd::runtime::config {
class RuntimeConfig;
}

namespace epd::util {
class DeviceAddress;
}

namespace epd::model {
enum class AssetKind : std::uint8_t;
}

namespace epd::observability {

/*
  One key=value pair appended to a log line. Values holding spaces,
  quotes or '=' are quoted on output so lines stay machine-splittable.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// device=<uppercase address>, the key every store log line shares.
LogField DeviceField(const epd::util::DeviceAddress& address);
// kind=vector|raster|preview
LogField KindField(epd::model::AssetKind kind);

/*
  Installs the "epd-server" logger as the default. Level and pattern come
  from EPD_LOG_LEVEL / EPD_LOG_PATTERN, then the config, then info and the
  built-in pattern. An unknown level name falls back to info with a warning.
*/
void InitializeLogging(const epd::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Renders "<message> k=v ..." plus trace_id/span_id when enabled.
std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace epd::observability

#define EPD_LOG_DEBUG(message, ...) ::epd::observability::LogDebug((message), ##__VA_ARGS__)
#define EPD_LOG_INFO(message, ...) ::epd::observability::LogInfo((message), ##__VA_ARGS__)
#define EPD_LOG_WARN(message, ...) ::epd::observability::LogWarn((message), ##__VA_ARGS__)
#define EPD_LOG_ERROR(message, ...) ::epd::observability::LogError((message), ##__VA_ARGS__)
