#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"
#include "internal/storage/memory/memory_artifact_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/proto_json.hpp"
#include "test_support.hpp"

namespace {

using modelreg::storage::DiskArtifactStore;
using modelreg::storage::MemoryArtifactStore;
using modelreg::testing::TempDir;
using namespace modelreg::registry::v1;

void TestDiskWriteReadAndLayout() {
  TempDir           dir("disk_layout");
  DiskArtifactStore store(dir.Path(), true);

  const auto locator = store.Write("fraud", "1.0.0", arrow::Buffer::FromString("model-bytes"));
  assert(locator == "fraud/1.0.0/model.bin");
  assert(std::filesystem::is_regular_file(dir.Path() / "fraud" / "1.0.0" / "model.bin"));
  assert(!std::filesystem::exists(dir.Path() / "fraud" / "1.0.0" / "model.bin.tmp"));
  assert(store.Exists(locator));
  assert(store.Read(locator)->ToString() == "model-bytes");
}

void TestDiskSidecarMirrorsRecord() {
  TempDir           dir("disk_sidecar");
  DiskArtifactStore store(dir.Path(), false);

  VersionRecord record;
  record.set_model_name("fraud");
  record.set_version("1.0.0");
  record.set_description("baseline");
  (*record.mutable_metrics())["auc"] = 0.91;
  store.WriteSidecar(record);

  const auto bytes = modelreg::storage::common::ReadFile(dir.Path() / "fraud" / "1.0.0" / "metadata.json");

  VersionRecord parsed;
  std::string   error;
  assert(modelreg::util::FromJson(bytes->ToString(), &parsed, &error));
  assert(parsed.description() == "baseline");
  assert(parsed.metrics().at("auc") == 0.91);
}

void TestDiskRemoveDropsVersionAndEmptyModelDir() {
  TempDir           dir("disk_remove");
  DiskArtifactStore store(dir.Path(), false);

  const auto first = store.Write("fraud", "1.0.0", arrow::Buffer::FromString("a"));
  store.Write("fraud", "1.0.1", arrow::Buffer::FromString("b"));

  store.Remove("fraud", "1.0.0");
  assert(!store.Exists(first));
  assert(std::filesystem::exists(dir.Path() / "fraud"));

  store.Remove("fraud", "1.0.1");
  assert(!std::filesystem::exists(dir.Path() / "fraud"));

  // Already gone is not an error.
  store.Remove("fraud", "1.0.1");
}

void TestPathEscapesAreRejected() {
  TempDir           dir("disk_escape");
  DiskArtifactStore store(dir.Path(), false);

  bool threw = false;
  try {
    store.Write("..", "1.0.0", arrow::Buffer::FromString("x"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)store.Read("../outside/model.bin");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    modelreg::storage::common::ValidateModelName("a/b");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestMemoryStoreRoundTrip() {
  MemoryArtifactStore store;

  const auto locator = store.Write("fraud", "2.0.0", arrow::Buffer::FromString("bytes"));
  assert(store.Exists(locator));
  assert(store.Size() == 1);
  assert(store.Read(locator)->ToString() == "bytes");

  store.Remove("fraud", "2.0.0");
  assert(!store.Exists(locator));
  assert(store.Size() == 0);
}

void TestFactoryResolvesArtifactDirAgainstRoot() {
  TempDir dir("factory");

  modelreg::runtime::config::RuntimeConfig config;
  config.mutable_registry()->set_root_path(dir.Path().string());
  config.mutable_storage()->set_kind(modelreg::runtime::config::STORAGE_KIND_DISK);
  config.mutable_storage()->set_artifact_dir("artifacts");
  config.mutable_storage()->set_fsync(false);

  auto store = modelreg::storage::StorageFactory::Build(config);
  assert(store->Kind() == "disk");
  store->Write("fraud", "1.0.0", arrow::Buffer::FromString("x"));
  assert(std::filesystem::exists(dir.Path() / "artifacts" / "fraud" / "1.0.0" / "model.bin"));

  config.mutable_storage()->set_kind(modelreg::runtime::config::STORAGE_KIND_MEMORY);
  assert(modelreg::storage::StorageFactory::Build(config)->Kind() == "memory");
}

} // namespace

int main() {
  TestDiskWriteReadAndLayout();
  TestDiskSidecarMirrorsRecord();
  TestDiskRemoveDropsVersionAndEmptyModelDir();
  TestPathEscapesAreRejected();
  TestMemoryStoreRoundTrip();
  TestFactoryResolvesArtifactDirAgainstRoot();

  std::cout << "model_registry_unit_artifact_store: pass\n";
  return 0;
}
