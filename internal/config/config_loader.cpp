#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace komorebi::config {
namespace {

using komorebi::runtime::config::RuntimeConfig;

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void ToProtoScalar(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars stay strings so "OUTPUT_FORMAT_TEXT" or "0" are not retyped.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      ToProtoScalar(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  if (yaml.IsNull()) {
    return Defaults();
  }

  google::protobuf::Value document;
  ToProtoValue(yaml, &document);

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(document, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  RuntimeConfig parsed;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  // Fields left out of the file keep their defaults.
  auto config = Defaults();
  config.MergeFrom(parsed);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_output()->set_format(komorebi::runtime::config::OUTPUT_FORMAT_TEXT);
  return config;
}

} // namespace komorebi::config
