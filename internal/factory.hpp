#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/model_registry.hpp"

namespace modelreg::factory {

/*
  Application

  Long-lived objects of one registry. The store and artifact store are kept
  alongside the facade so tools can inspect them directly.
*/
struct Application {
  store::RegistryStorePtr              store;
  storage::ArtifactStorePtr            artifacts;
  std::shared_ptr<core::ModelRegistry> registry;
};

/*
  Build

  Composition root: the only place that knows concrete store types.
  storage.kind selects both backends (disk -> JSON document + files,
  memory -> in-process).
*/
Application Build(const modelreg::runtime::config::RuntimeConfig& config);

} // namespace modelreg::factory
