#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/storage/artifact_store.hpp"
#include "internal/store/api/registry_store.hpp"
#include "modelreg/registry/v1/version.pb.h"

namespace modelreg::core {

/*
  Owns every write that creates a version or changes its lifecycle.

  All operations run lock -> load -> modify -> commit on the registry store.
  This is the only component that moves a production pointer.
*/
class PromotionManager {
 public:
  PromotionManager(store::RegistryStorePtr store, storage::ArtifactStorePtr artifacts, std::chrono::milliseconds lock_timeout);

  /*
    Allocates the next version, persists artifact + sidecar, appends the
    record and commits.

    Throws:
      std::invalid_argument       bad model name or missing artifact
      util::ArtifactWriteFailed   bytes not persisted; registry untouched
  */
  modelreg::registry::v1::VersionRecord Register(const modelreg::registry::v1::RegisterModelRequest& request,
                                                 const std::shared_ptr<arrow::Buffer>&             artifact);

  // Idempotent. Archived versions cannot be promoted.
  void Promote(const std::string& model_name, const std::string& version);

  void Deprecate(const std::string& model_name, const std::string& version);

  // Refused for the current production version.
  void Archive(const std::string& model_name, const std::string& version);

 private:
  // Shared path of Deprecate/Archive. Returns true if the document changed.
  bool Transition(const std::string& model_name, const std::string& version, modelreg::registry::v1::VersionStatus target);

  // Rewrites metadata.json after a lifecycle commit, under the same lock.
  void RefreshSidecar(const modelreg::registry::v1::VersionRecord& record);

  store::RegistryStorePtr   store_;
  storage::ArtifactStorePtr artifacts_;
  std::chrono::milliseconds lock_timeout_;
};

} // namespace modelreg::core
