#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/store/file/json_file_registry_store.hpp"
#include "internal/store/memory/memory_registry_store.hpp"

namespace modelreg::factory {

using namespace modelreg;

namespace {

store::RegistryStorePtr BuildStore(const modelreg::runtime::config::RuntimeConfig& config) {
  switch (config.storage().kind()) {
    case modelreg::runtime::config::STORAGE_KIND_MEMORY:
      return std::make_shared<store::memory::MemoryRegistryStore>();

    case modelreg::runtime::config::STORAGE_KIND_UNSPECIFIED:
    case modelreg::runtime::config::STORAGE_KIND_DISK: {
      const auto& registry = config.registry();
      const bool  fsync    = !config.storage().has_fsync() || config.storage().fsync();
      return std::make_shared<store::file::JsonFileRegistryStore>(std::filesystem::path{registry.root_path()}, registry.document_name(), fsync);
    }

    default:
      throw std::runtime_error("unsupported storage kind " + std::to_string(config.storage().kind()));
  }
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const modelreg::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Backends
  // ------------------------------------------------------------------
  app.store     = BuildStore(config);
  app.artifacts = storage::StorageFactory::Build(config);

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  const auto lock_timeout = std::chrono::milliseconds(config.registry().lock_timeout_ms());
  app.registry            = std::make_shared<core::ModelRegistry>(app.store, app.artifacts, lock_timeout);

  MODELREG_LOG_DEBUG("registry ready", {observability::StringField("store", app.store->Describe()),
                                        observability::StringField("artifacts", app.artifacts->Kind())});
  return app;
}

} // namespace modelreg::factory
