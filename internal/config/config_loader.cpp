#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace ctxsync::config {

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

static ctxsync::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  ctxsync::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

ctxsync::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

ctxsync::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

void ConfigLoader::Validate(const ctxsync::runtime::config::RuntimeConfig& config) {
  const auto& sync = config.sync();

  std::set<std::string> a_fields(sync.a_authoritative_fields().begin(), sync.a_authoritative_fields().end());
  for (const auto& field : sync.b_authoritative_fields()) {
    if (a_fields.contains(field)) {
      throw util::ValidationError("Invalid configuration: field '" + field + "' is authoritative for both system_a and system_b");
    }
  }

  const double target = config.cache().target_hit_rate();
  if (target < 0.0 || target > 1.0) {
    throw util::ValidationError("Invalid configuration: cache.target_hit_rate must be within [0, 1]");
  }

  if (config.cache().l2().enabled() && config.cache().l2().endpoint().empty()) {
    throw util::ValidationError("Invalid configuration: cache.l2.endpoint is required when l2 is enabled");
  }

  if (config.index().enabled() && (config.index().embedder_endpoint().empty() || config.index().vector_store_endpoint().empty())) {
    throw util::ValidationError("Invalid configuration: index requires embedder_endpoint and vector_store_endpoint");
  }

  if (sync.enabled() && (config.system_a().endpoint().empty() || config.system_b().endpoint().empty())) {
    throw util::ValidationError("Invalid configuration: sync requires system_a.endpoint and system_b.endpoint");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::ValidationError("Invalid configuration: database.sqlite.path is required");
  }

  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw util::ValidationError("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace ctxsync::config
