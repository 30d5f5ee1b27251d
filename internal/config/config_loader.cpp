#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace entitlement::config {

using entitlement::runtime::config::RuntimeConfig;

namespace {

constexpr char kDefaultBindAddress[] = "0.0.0.0:650";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

// Plain scalars are typed by content; quoted ones ("650", 'true') stay strings.
void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end != nullptr && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.as<std::string>()]);
      }
      return;
    }
  }

  throw util::InvalidConfig("unsupported YAML node");
}

std::string LoadYamlAsJson(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig("failed to load YAML config " + path + ": " + e.what());
  }

  // An empty file is an empty config, not an error.
  google::protobuf::Value root;
  if (yaml.IsNull()) {
    root.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &root);
  }

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw util::InvalidConfig("failed to convert YAML config to JSON: " + std::string(status.message()));
  }
  return json;
}

void ApplyDefaults(RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* observability = config->mutable_observability();
  if (observability->service_name().empty()) {
    observability->set_service_name(kDefaultServiceName);
  }
  if (observability->service_version().empty()) {
    observability->set_service_version(kDefaultServiceVersion);
  }
}

void Validate(const RuntimeConfig& config) {
  if (config.server().bind_address().find(':') == std::string::npos) {
    throw util::InvalidConfig("server.bind_address must be host:port, got '" + config.server().bind_address() + "'");
  }

  const auto& observability = config.observability();
  if ((observability.tracing_enabled() || observability.metrics_enabled()) && observability.otlp_endpoint().empty()) {
    throw util::InvalidConfig("observability.otlp_endpoint is required when tracing or metrics are enabled");
  }

  const auto& enterprise = config.enterprise();
  if (!enterprise.public_key_pem().empty() && !enterprise.public_key_path().empty()) {
    throw util::InvalidConfig("enterprise.public_key_pem and enterprise.public_key_path are mutually exclusive");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  const auto json = LoadYamlAsJson(path);

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig config;
  const auto    status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidConfig("invalid configuration " + path + ": " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

std::string ConfigLoader::ResolvePublicKeyPem(const RuntimeConfig& config) {
  const auto& enterprise = config.enterprise();
  if (!enterprise.public_key_pem().empty() && !enterprise.public_key_path().empty()) {
    throw util::InvalidConfig("enterprise.public_key_pem and enterprise.public_key_path are mutually exclusive");
  }
  if (!enterprise.public_key_pem().empty()) {
    return enterprise.public_key_pem();
  }

  if (enterprise.public_key_path().empty()) {
    throw util::InvalidConfig("enterprise.public_key_pem or enterprise.public_key_path is required");
  }

  std::ifstream in(enterprise.public_key_path());
  if (!in) {
    throw util::InvalidConfig("cannot read public key file: " + enterprise.public_key_path());
  }

  std::ostringstream pem;
  pem << in.rdbuf();
  if (pem.str().empty()) {
    throw util::InvalidConfig("public key file is empty: " + enterprise.public_key_path());
  }
  return pem.str();
}

} // namespace entitlement::config
