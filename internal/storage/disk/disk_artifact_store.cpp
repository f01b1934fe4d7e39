#include "disk_artifact_store.hpp"

#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

namespace modelreg::storage {

using namespace modelreg::storage::common;

DiskArtifactStore::DiskArtifactStore(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

/*
  Bytes go through write tmp → flush → rename, so a version directory never
  holds a torn model.bin.
*/
std::string DiskArtifactStore::Write(const std::string& model_name, const std::string& version, const std::shared_ptr<arrow::Buffer>& bytes) {
  const auto dir     = VersionDir(root_, model_name, version);
  const auto locator = ArtifactLocator(model_name, version);

  bool created_dir = false;
  try {
    created_dir = std::filesystem::create_directories(dir);
    AtomicReplace(dir / kArtifactFileName, bytes->data(), bytes->size(), fsync_);
  } catch (const std::exception& e) {
    if (created_dir) {
      std::error_code ignored;
      std::filesystem::remove_all(dir, ignored);
    }
    throw util::ArtifactWriteFailed("write artifact " + locator + ": " + e.what());
  }

  return locator;
}

void DiskArtifactStore::WriteSidecar(const modelreg::registry::v1::VersionRecord& record) {
  const auto dir = VersionDir(root_, record.model_name(), record.version());

  try {
    std::filesystem::create_directories(dir);
    AtomicReplace(dir / kSidecarFileName, util::ToJson(record), fsync_);
  } catch (const std::exception& e) {
    throw util::ArtifactWriteFailed("write sidecar for " + record.model_name() + " v" + record.version() + ": " + e.what());
  }
}

/*
  Read entire artifact from disk.
*/
std::shared_ptr<arrow::Buffer> DiskArtifactStore::Read(const std::string& locator) {
  return ReadFile(ResolveLocator(root_, locator));
}

bool DiskArtifactStore::Exists(const std::string& locator) {
  std::error_code ec;
  return std::filesystem::is_regular_file(ResolveLocator(root_, locator), ec);
}

/*
  Remove the whole version directory; drop the model directory once empty.
*/
void DiskArtifactStore::Remove(const std::string& model_name, const std::string& version) {
  const auto dir = VersionDir(root_, model_name, version);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  if (ec) {
    throw util::ArtifactDeleteFailed("remove artifact " + model_name + " v" + version + ": " + ec.message());
  }

  const auto model_dir = root_ / model_name;
  if (std::filesystem::is_directory(model_dir, ec) && std::filesystem::is_empty(model_dir, ec)) {
    std::filesystem::remove(model_dir, ec);
  }
}

} // namespace modelreg::storage
