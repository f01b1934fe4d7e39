#include "memory_artifact_store.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/proto_json.hpp"

namespace modelreg::storage {

using namespace modelreg::storage::common;

std::string MemoryArtifactStore::Write(const std::string& model_name, const std::string& version, const std::shared_ptr<arrow::Buffer>& bytes) {
  auto locator = ArtifactLocator(model_name, version);

  std::unique_lock lock(mutex_);
  buffers_[locator] = bytes;
  return locator;
}

void MemoryArtifactStore::WriteSidecar(const modelreg::registry::v1::VersionRecord& record) {
  auto json = util::ToJson(record);

  std::unique_lock lock(mutex_);
  sidecars_[ArtifactLocator(record.model_name(), record.version())] = std::move(json);
}

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> MemoryArtifactStore::Read(const std::string& locator) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(locator);
  if (it == buffers_.end()) throw std::runtime_error("artifact not found: " + locator);

  return it->second;
}

bool MemoryArtifactStore::Exists(const std::string& locator) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(locator);
}

void MemoryArtifactStore::Remove(const std::string& model_name, const std::string& version) {
  const auto locator = ArtifactLocator(model_name, version);

  std::unique_lock lock(mutex_);
  buffers_.erase(locator);
  sidecars_.erase(locator);
}

std::size_t MemoryArtifactStore::Size() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

} // namespace modelreg::storage
