#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/storage/artifact_store.hpp"
#include "internal/store/api/registry_store.hpp"
#include "modelreg/registry/v1/reports.pb.h"

namespace modelreg::core {

/*
  Garbage-collects old versions of a model line.

  Retain-set: the newest `keep_last_n` records plus, with `keep_production`,
  the production record. Everything else loses its artifact first and its
  record second, so a record never outlives nothing on disk and vice versa.
  A failed artifact delete keeps that record and is reported, never fatal.
*/
class RetentionManager {
 public:
  RetentionManager(store::RegistryStorePtr store, storage::ArtifactStorePtr artifacts, std::chrono::milliseconds lock_timeout);

  // keep_last_n must be >= 1. Throws util::ModelNotFound.
  modelreg::registry::v1::CleanupReport Cleanup(const std::string& model_name, uint32_t keep_last_n, bool keep_production = true);

 private:
  store::RegistryStorePtr   store_;
  storage::ArtifactStorePtr artifacts_;
  std::chrono::milliseconds lock_timeout_;
};

} // namespace modelreg::core
