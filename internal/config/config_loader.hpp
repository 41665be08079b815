#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

#include "config/config.pb.h"

namespace epd::config {

inline constexpr const char* kDefaultBindAddress = "127.0.0.1:3000";

// Values given on the command line; they win over the file.
struct ConfigOverrides {
  std::optional<std::string>   image_dir;
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
  std::optional<std::string>   bind_address;
};

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static epd::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static epd::runtime::config::RuntimeConfig LoadFromString(const std::string& text);

  static void ApplyOverrides(const ConfigOverrides& overrides, epd::runtime::config::RuntimeConfig* config);
  static void ApplyDefaults(epd::runtime::config::RuntimeConfig* config);

  // Throws std::invalid_argument naming the first missing or bad field.
  static void ValidateConfig(const epd::runtime::config::RuntimeConfig& config);

 private:
  static epd::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml);
};

} // namespace epd::config
