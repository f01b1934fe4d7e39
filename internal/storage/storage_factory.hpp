#pragma once

#include "artifact_store.hpp"
#include "config/config.pb.h"

namespace modelreg::storage {

/*
  Builds the artifact store selected by configuration.

  Core uses this as:

      auto artifacts = StorageFactory::Build(config);
      artifacts->Write(model, version, bytes);
*/

class StorageFactory {
 public:
  static ArtifactStorePtr Build(const modelreg::runtime::config::RuntimeConfig& cfg);
};

} // namespace modelreg::storage
