#include "storage_factory.hpp"

#include <filesystem>
#include <stdexcept>

#include "disk/disk_artifact_store.hpp"
#include "memory/memory_artifact_store.hpp"

namespace modelreg::storage {

ArtifactStorePtr StorageFactory::Build(const modelreg::runtime::config::RuntimeConfig& cfg) {
  const auto& storage = cfg.storage();

  switch (storage.kind()) {
    case modelreg::runtime::config::STORAGE_KIND_MEMORY:
      return std::make_shared<MemoryArtifactStore>();

    case modelreg::runtime::config::STORAGE_KIND_UNSPECIFIED:
    case modelreg::runtime::config::STORAGE_KIND_DISK: {
      std::filesystem::path artifact_root = storage.artifact_dir().empty() ? std::filesystem::path{"artifacts"} : std::filesystem::path{storage.artifact_dir()};
      if (artifact_root.is_relative()) {
        artifact_root = std::filesystem::path{cfg.registry().root_path()} / artifact_root;
      }
      return std::make_shared<DiskArtifactStore>(std::move(artifact_root), !storage.has_fsync() || storage.fsync());
    }

    default:
      throw std::runtime_error("unsupported storage kind " + std::to_string(storage.kind()));
  }
}

} // namespace modelreg::storage
