#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "modelreg/registry/v1/registry.pb.h"
#include "modelreg/registry/v1/version.pb.h"

namespace modelreg::store {

inline constexpr uint32_t kFormatVersion = 1;

// ------------------------------------------------------------
// Lookups
// ------------------------------------------------------------

const modelreg::registry::v1::ModelLine* FindLine(const modelreg::registry::v1::Registry& registry, const std::string& model_name);
modelreg::registry::v1::ModelLine*       FindLine(modelreg::registry::v1::Registry* registry, const std::string& model_name);

const modelreg::registry::v1::VersionRecord* FindVersion(const modelreg::registry::v1::ModelLine& line, const std::string& version);
modelreg::registry::v1::VersionRecord*       FindVersion(modelreg::registry::v1::ModelLine* line, const std::string& version);

std::optional<std::string> ProductionVersion(const modelreg::registry::v1::Registry& registry, const std::string& model_name);

// Throws util::ModelNotFound.
const modelreg::registry::v1::ModelLine& RequireLine(const modelreg::registry::v1::Registry& registry, const std::string& model_name);
modelreg::registry::v1::ModelLine&       RequireLine(modelreg::registry::v1::Registry* registry, const std::string& model_name);

// Throws util::ModelNotFound or util::VersionNotFound.
const modelreg::registry::v1::VersionRecord& RequireVersion(const modelreg::registry::v1::Registry& registry, const std::string& model_name,
                                                            const std::string& version);
modelreg::registry::v1::VersionRecord&       RequireVersion(modelreg::registry::v1::Registry* registry, const std::string& model_name,
                                                            const std::string& version);

// ------------------------------------------------------------
// Invariants
// ------------------------------------------------------------

// Recompute every record's is_production from production_versions.
void SyncProductionFlags(modelreg::registry::v1::Registry* registry);

/*
  Structural validation of a loaded document. Throws util::RegistryCorrupt on:
    - unsupported format_version
    - a record filed under the wrong model name
    - unparseable, duplicate or non-increasing versions
    - a production pointer naming a missing version
*/
void ValidateDocument(const modelreg::registry::v1::Registry& registry);

// format_version + last_updated + production flags, right before serialization.
void PrepareForCommit(modelreg::registry::v1::Registry* registry);

// Parse + validate + sync. `source` only feeds error messages.
modelreg::registry::v1::Registry ParseDocument(const std::string& json, const std::string& source);

std::string SerializeDocument(const modelreg::registry::v1::Registry& registry);

} // namespace modelreg::store
