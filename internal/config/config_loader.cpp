#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace epd::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

epd::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

epd::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

epd::runtime::config::RuntimeConfig ConfigLoader::ParseYaml(const YAML::Node& yaml) {
  epd::runtime::config::RuntimeConfig config;

  // An empty document is a valid, empty config; flags may supply the rest.
  if (!yaml || yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::ApplyOverrides(const ConfigOverrides& overrides, epd::runtime::config::RuntimeConfig* config) {
  if (overrides.image_dir) {
    config->mutable_store()->set_image_dir(*overrides.image_dir);
  }
  if (overrides.width) {
    config->mutable_display()->set_width(*overrides.width);
  }
  if (overrides.height) {
    config->mutable_display()->set_height(*overrides.height);
  }
  if (overrides.bind_address) {
    config->mutable_server()->set_bind_address(*overrides.bind_address);
  }
}

void ConfigLoader::ApplyDefaults(epd::runtime::config::RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }
  if (!config->rasterizer().has_load_system_fonts()) {
    config->mutable_rasterizer()->set_load_system_fonts(true);
  }
}

void ConfigLoader::ValidateConfig(const epd::runtime::config::RuntimeConfig& config) {
  if (config.store().image_dir().empty()) {
    throw std::invalid_argument("store.image_dir is required (or pass --image-dir)");
  }
  if (config.display().width() == 0) {
    throw std::invalid_argument("display.width must be greater than zero (or pass --epd-width)");
  }
  if (config.display().height() == 0) {
    throw std::invalid_argument("display.height must be greater than zero (or pass --epd-height)");
  }
  if (config.server().bind_address().empty()) {
    throw std::invalid_argument("server.bind_address must not be empty");
  }
}

} // namespace epd::config
