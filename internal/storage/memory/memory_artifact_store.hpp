#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <arrow/buffer.h>

#include "internal/storage/artifact_store.hpp"

namespace modelreg::storage {

/*
  In-process artifact storage.

  Backed by Arrow buffers stored in-memory.
  Provides zero-copy reads to callers.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class MemoryArtifactStore final : public ArtifactStore {
 public:
  MemoryArtifactStore()           = default;
  ~MemoryArtifactStore() override = default;

  std::string Write(const std::string& model_name, const std::string& version, const std::shared_ptr<arrow::Buffer>& bytes) override;

  void WriteSidecar(const modelreg::registry::v1::VersionRecord& record) override;

  std::shared_ptr<arrow::Buffer> Read(const std::string& locator) override;

  bool Exists(const std::string& locator) override;

  void Remove(const std::string& model_name, const std::string& version) override;

  std::string Kind() const override {
    return "memory";
  }

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                                        mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
  std::unordered_map<std::string, std::string>                     sidecars_;
};

} // namespace modelreg::storage
