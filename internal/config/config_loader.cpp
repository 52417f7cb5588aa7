#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace roipack::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("4.0")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
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

roipack::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  roipack::runtime::config::RuntimeConfig config;

  auto* logging = config.mutable_logging();
  logging->set_level("info");
  logging->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v");

  auto* exporter = config.mutable_exporter();
  exporter->set_generator_identity("DORA Comply RoI Engine v1.0");
  exporter->set_format_version("4.0");
  exporter->set_default_currency("EUR");
  exporter->set_decimals_integer(0);
  exporter->set_decimals_monetary(-3);
  exporter->set_compression_level(9);
  exporter->set_output_dir(".");

  return config;
}

void ConfigLoader::Validate(const roipack::runtime::config::RuntimeConfig& config) {
  const auto& exporter = config.exporter();

  if (exporter.has_compression_level() && (exporter.compression_level() < 0 || exporter.compression_level() > 9)) {
    throw std::runtime_error("Invalid configuration: exporter.compression_level must be within 0..9, got " +
                             std::to_string(exporter.compression_level()));
  }

  if (exporter.default_currency().size() != 3) {
    throw std::runtime_error("Invalid configuration: exporter.default_currency must be a 3-letter ISO 4217 code");
  }
}

roipack::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = Defaults();

  // empty document
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  roipack::runtime::config::RuntimeConfig loaded;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &loaded, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  config.MergeFrom(loaded);
  Validate(config);

  return config;
}

} // namespace roipack::config
