#pragma once

#include <filesystem>

#include "internal/storage/artifact_store.hpp"

namespace modelreg::storage {

/*
  Durable disk storage using Arrow IO.

  Layout:
    <root>/<model>/<version>/model.bin
    <root>/<model>/<version>/metadata.json

  Properties:
    - atomic replace writes
    - optional fsync
*/

class DiskArtifactStore final : public ArtifactStore {
 public:
  DiskArtifactStore(std::filesystem::path root, bool fsync);

  std::string Write(const std::string& model_name, const std::string& version, const std::shared_ptr<arrow::Buffer>& bytes) override;

  void WriteSidecar(const modelreg::registry::v1::VersionRecord& record) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& locator) override;

  bool Exists(const std::string& locator) override;

  void Remove(const std::string& model_name, const std::string& version) override;

  std::string Kind() const override {
    return "disk";
  }

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace modelreg::storage
