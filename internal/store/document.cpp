#include "document.hpp"

#include <stdexcept>

#include "internal/model/semantic_version.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

namespace modelreg::store {

using namespace modelreg::registry::v1;

const ModelLine* FindLine(const Registry& registry, const std::string& model_name) {
  const auto it = registry.models().find(model_name);
  return it == registry.models().end() ? nullptr : &it->second;
}

ModelLine* FindLine(Registry* registry, const std::string& model_name) {
  auto* models = registry->mutable_models();
  auto  it     = models->find(model_name);
  return it == models->end() ? nullptr : &it->second;
}

const VersionRecord* FindVersion(const ModelLine& line, const std::string& version) {
  for (const auto& record : line.versions()) {
    if (record.version() == version) {
      return &record;
    }
  }
  return nullptr;
}

VersionRecord* FindVersion(ModelLine* line, const std::string& version) {
  for (auto& record : *line->mutable_versions()) {
    if (record.version() == version) {
      return &record;
    }
  }
  return nullptr;
}

std::optional<std::string> ProductionVersion(const Registry& registry, const std::string& model_name) {
  const auto it = registry.production_versions().find(model_name);
  if (it == registry.production_versions().end()) {
    return std::nullopt;
  }
  return it->second;
}

const ModelLine& RequireLine(const Registry& registry, const std::string& model_name) {
  const auto* line = FindLine(registry, model_name);
  if (!line) throw util::ModelNotFound("model '" + model_name + "' not found in registry");
  return *line;
}

ModelLine& RequireLine(Registry* registry, const std::string& model_name) {
  auto* line = FindLine(registry, model_name);
  if (!line) throw util::ModelNotFound("model '" + model_name + "' not found in registry");
  return *line;
}

const VersionRecord& RequireVersion(const Registry& registry, const std::string& model_name, const std::string& version) {
  const auto* record = FindVersion(RequireLine(registry, model_name), version);
  if (!record) throw util::VersionNotFound("version " + version + " not found for model '" + model_name + "'");
  return *record;
}

VersionRecord& RequireVersion(Registry* registry, const std::string& model_name, const std::string& version) {
  auto* record = FindVersion(&RequireLine(registry, model_name), version);
  if (!record) throw util::VersionNotFound("version " + version + " not found for model '" + model_name + "'");
  return *record;
}

void SyncProductionFlags(Registry* registry) {
  for (auto& [model_name, line] : *registry->mutable_models()) {
    const auto production = ProductionVersion(*registry, model_name);
    for (auto& record : *line.mutable_versions()) {
      record.set_is_production(production.has_value() && record.version() == *production);
    }
  }
}

void ValidateDocument(const Registry& registry) {
  if (registry.format_version() > kFormatVersion) {
    throw util::RegistryCorrupt("unsupported registry format_version " + std::to_string(registry.format_version()));
  }

  for (const auto& [model_name, line] : registry.models()) {
    if (model_name.empty()) {
      throw util::RegistryCorrupt("registry contains a model line with an empty name");
    }

    const std::string* previous = nullptr;
    for (const auto& record : line.versions()) {
      if (record.model_name() != model_name) {
        throw util::RegistryCorrupt("record " + record.version() + " of model '" + record.model_name() + "' is filed under '" + model_name + "'");
      }
      try {
        if (previous && model::CompareVersions(*previous, record.version()) >= 0) {
          throw util::RegistryCorrupt("model '" + model_name + "' versions are not strictly increasing at " + record.version());
        }
        (void)model::ParseVersion(record.version());
      } catch (const util::InvalidVersionFormat& e) {
        throw util::RegistryCorrupt("model '" + model_name + "': " + e.what());
      }
      previous = &record.version();
    }
  }

  for (const auto& [model_name, version] : registry.production_versions()) {
    const auto* line = FindLine(registry, model_name);
    if (!line || !FindVersion(*line, version)) {
      throw util::RegistryCorrupt("production pointer " + model_name + "@" + version + " names a version that does not exist");
    }
  }
}

void PrepareForCommit(Registry* registry) {
  registry->set_format_version(kFormatVersion);
  *registry->mutable_last_updated() = util::ToProto(util::Now());
  SyncProductionFlags(registry);
}

Registry ParseDocument(const std::string& json, const std::string& source) {
  Registry    registry;
  std::string error;
  if (!util::FromJson(json, &registry, &error)) {
    throw util::RegistryCorrupt("registry document " + source + " is malformed: " + error);
  }

  ValidateDocument(registry);
  SyncProductionFlags(&registry);
  return registry;
}

std::string SerializeDocument(const Registry& registry) {
  return util::ToJson(registry);
}

} // namespace modelreg::store
