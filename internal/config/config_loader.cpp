#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace flowlog::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // quoted scalars carry the non-specific tag "!"
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  if (!scalar.empty()) {
    char*        endptr  = nullptr;
    const double numeric = std::strtod(scalar.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }
  }
}

flowlog::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  flowlog::runtime::config::RuntimeConfig config;

  // an empty document is the all-defaults config
  if (yaml.IsNull()) return config;
  if (!yaml.IsMap()) throw std::runtime_error("Invalid configuration: top level must be a mapping");

  google::protobuf::Value value;
  YamlToProtoValue(yaml, &value);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(value, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

flowlog::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromYamlNode(yaml);
}

flowlog::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const flowlog::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::InvalidArgument("database.postgres.connection_uri must be set");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
    throw util::InvalidArgument("logging.level: unknown level '" + level + "'");
  }
}

} // namespace flowlog::config
