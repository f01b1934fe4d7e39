#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/lineage_exporter.hpp"
#include "internal/core/promotion_manager.hpp"
#include "internal/core/retention_manager.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/store/api/registry_store.hpp"
#include "modelreg/registry/v1.hpp"

namespace modelreg::core {

// A version record together with its artifact bytes.
struct LoadedModel {
  modelreg::registry::v1::VersionRecord record;
  std::shared_ptr<arrow::Buffer>        bytes;
};

struct LoadFailure {
  std::string model_name;
  std::string version;
  std::string error;
};

struct ProductionModels {
  std::vector<LoadedModel> models;
  std::vector<LoadFailure> failures;
};

/*
  Entry point for trainers, serving layers and operators.

  Writes go through PromotionManager / RetentionManager under the registry
  lock. Reads work from a committed snapshot and never block writers.
  Every operation is traced and counted.
*/
class ModelRegistry {
 public:
  ModelRegistry(store::RegistryStorePtr store, storage::ArtifactStorePtr artifacts, std::chrono::milliseconds lock_timeout);

  // ------------------------------------------------------------------
  // Trainer
  // ------------------------------------------------------------------
  modelreg::registry::v1::VersionRecord Register(const modelreg::registry::v1::RegisterModelRequest& request,
                                                 const std::shared_ptr<arrow::Buffer>&             artifact);
  modelreg::registry::v1::VersionRecord Register(const modelreg::registry::v1::RegisterModelRequest& request, const std::string& artifact);

  // ------------------------------------------------------------------
  // Lifecycle
  // ------------------------------------------------------------------
  void Promote(const std::string& model_name, const std::string& version);
  void Deprecate(const std::string& model_name, const std::string& version);
  void Archive(const std::string& model_name, const std::string& version);

  // ------------------------------------------------------------------
  // Serving
  // ------------------------------------------------------------------
  /*
    Without a version: production when set, otherwise the latest record.
    Throws util::ModelNotFound / util::VersionNotFound.
  */
  LoadedModel Load(const std::string& model_name, const std::optional<std::string>& version = std::nullopt);

  // Throws util::ModelNotFound or util::NoProductionModel.
  LoadedModel GetProductionArtifact(const std::string& model_name);

  // Per-model failures are logged and returned, never thrown.
  ProductionModels GetProductionModels();

  // ------------------------------------------------------------------
  // Query
  // ------------------------------------------------------------------
  // Filters are optional; an unknown model simply matches nothing.
  std::vector<modelreg::registry::v1::VersionRecord> List(const std::optional<std::string>&                          model_name = std::nullopt,
                                                          const std::optional<modelreg::registry::v1::VersionStatus>& status = std::nullopt);

  modelreg::registry::v1::LineageReport ExportLineage(const std::string& model_name);
  modelreg::registry::v1::LineageReport ExportLineageToFile(const std::string& model_name, const std::filesystem::path& output_path);

  modelreg::registry::v1::VersionComparison CompareVersions(const std::string& model_name, const std::string& version1, const std::string& version2);

  modelreg::registry::v1::RegistrySummary Summary();

  // ------------------------------------------------------------------
  // Retention
  // ------------------------------------------------------------------
  modelreg::registry::v1::CleanupReport Cleanup(const std::string& model_name, uint32_t keep_last_n, bool keep_production = true);

  const store::RegistryStorePtr& Store() const {
    return store_;
  }
  const storage::ArtifactStorePtr& Artifacts() const {
    return artifacts_;
  }

 private:
  LoadedModel Fetch(const modelreg::registry::v1::VersionRecord& record);

  store::RegistryStorePtr   store_;
  storage::ArtifactStorePtr artifacts_;

  PromotionManager promotion_;
  RetentionManager retention_;
  LineageExporter  lineage_;
};

} // namespace modelreg::core
