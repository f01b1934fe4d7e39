#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace modelreg::config {

using modelreg::runtime::config::RuntimeConfig;

namespace {

using google::protobuf::Value;

// Quoted scalars ("!" tag) stay strings; bare ones may be bools or numbers.
Value ScalarToValue(const YAML::Node& node) {
  Value              value;
  const std::string& text = node.Scalar();

  if (node.Tag() != "!") {
    if (text == "true" || text == "false") {
      value.set_bool_value(text == "true");
      return value;
    }
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end != nullptr && *end == '\0') {
      value.set_number_value(number);
      return value;
    }
  }

  value.set_string_value(text);
  return value;
}

Value YamlToValue(const YAML::Node& node) {
  Value value;
  if (node.IsNull()) {
    value.set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    value = ScalarToValue(node);
  } else if (node.IsSequence()) {
    auto* items = value.mutable_list_value();
    for (const auto& item : node) {
      *items->add_values() = YamlToValue(item);
    }
  } else if (node.IsMap()) {
    auto& fields = *value.mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      fields[entry.first.as<std::string>()] = YamlToValue(entry.second);
    }
  } else {
    throw std::runtime_error("unsupported YAML node in config");
  }
  return value;
}

} // namespace

// ------------------------------------------------------------
// Enum shorthands ("memory" -> "STORAGE_KIND_MEMORY")
// ------------------------------------------------------------

static void ExpandEnumShorthand(Value* root, const char* section, const char* field, const std::string& prefix) {
  if (!root->has_struct_value()) {
    return;
  }
  auto& sections = *root->mutable_struct_value()->mutable_fields();
  auto  section_it = sections.find(section);
  if (section_it == sections.end() || !section_it->second.has_struct_value()) {
    return;
  }
  auto& fields   = *section_it->second.mutable_struct_value()->mutable_fields();
  auto  field_it = fields.find(field);
  if (field_it == fields.end() || field_it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return;
  }

  std::string name = field_it->second.string_value();
  if (name.rfind(prefix, 0) == 0) {
    return;
  }
  for (auto& c : name) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  field_it->second.set_string_value(prefix + name);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* registry = config.mutable_registry();
  if (registry->root_path().empty()) {
    registry->set_root_path("models");
  }
  if (registry->document_name().empty()) {
    registry->set_document_name("registry.json");
  }
  if (registry->lock_timeout_ms() == 0) {
    registry->set_lock_timeout_ms(5000);
  }

  auto* storage = config.mutable_storage();
  if (storage->kind() == modelreg::runtime::config::STORAGE_KIND_UNSPECIFIED) {
    storage->set_kind(modelreg::runtime::config::STORAGE_KIND_DISK);
  }
  if (storage->artifact_dir().empty()) {
    storage->set_artifact_dir("artifacts");
  }
  if (!storage->has_fsync()) {
    storage->set_fsync(true);
  }

  auto* retention = config.mutable_retention();
  if (retention->keep_last_n() == 0) {
    retention->set_keep_last_n(5);
  }
  if (!retention->has_keep_production()) {
    retention->set_keep_production(true);
  }
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("cannot read config " + path + ": " + e.what());
  }

  RuntimeConfig config;
  if (!yaml.IsNull()) {
    Value root = YamlToValue(yaml);
    ExpandEnumShorthand(&root, "storage", "kind", "STORAGE_KIND_");
    ExpandEnumShorthand(&root, "observability", "transport", "OTLP_TRANSPORT_");

    // Value -> JSON -> RuntimeConfig; unknown keys are rejected.
    std::string json;
    if (auto status = google::protobuf::util::MessageToJsonString(root, &json); !status.ok()) {
      throw std::runtime_error("cannot convert config " + path + ": " + std::string(status.message()));
    }
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
      throw std::runtime_error("invalid config " + path + ": " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

} // namespace modelreg::config
