#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/store/document.hpp"
#include "internal/store/file/file_lock.hpp"
#include "internal/store/file/json_file_registry_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "test_support.hpp"

namespace {

using modelreg::store::file::FileLock;
using modelreg::store::file::JsonFileRegistryStore;
using modelreg::testing::TempDir;
using namespace modelreg::registry::v1;

// Publish step fails after the temp file is fully written.
class FailingPublishStore final : public JsonFileRegistryStore {
 public:
  using JsonFileRegistryStore::JsonFileRegistryStore;

  bool fail_publish = false;

 protected:
  void Publish(const std::filesystem::path& tmp, const std::filesystem::path& document) override {
    if (fail_publish) {
      assert(std::filesystem::exists(tmp));
      throw std::runtime_error("injected rename failure");
    }
    JsonFileRegistryStore::Publish(tmp, document);
  }
};

VersionRecord MakeRecord(const std::string& model_name, const std::string& version) {
  VersionRecord record;
  record.set_model_name(model_name);
  record.set_version(version);
  record.set_model_type("xgboost");
  record.set_status(VERSION_STATUS_ACTIVE);
  return record;
}

void WriteText(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::trunc);
  out << text;
}

void AppendVersion(JsonFileRegistryStore& store, const std::string& model_name, const std::string& version) {
  auto tx = store.Begin(modelreg::testing::kTestLockTimeout);
  *(*tx->Mutable().mutable_models())[model_name].add_versions() = MakeRecord(model_name, version);
  tx->Commit();
}

template <typename Fn>
bool ThrowsCorrupt(Fn&& fn) {
  try {
    fn();
  } catch (const modelreg::util::RegistryCorrupt&) {
    return true;
  }
  return false;
}

void TestMissingDocumentLoadsEmpty() {
  TempDir               dir("missing_document");
  JsonFileRegistryStore store(dir.Path(), "registry.json", false);

  const auto registry = store.Snapshot();
  assert(registry.models().empty());
  assert(registry.production_versions().empty());
  assert(registry.format_version() == modelreg::store::kFormatVersion);
  assert(!std::filesystem::exists(store.DocumentPath()));
}

void TestCommitPersistsAndRecomputesProductionFlags() {
  TempDir               dir("commit_persists");
  JsonFileRegistryStore store(dir.Path(), "registry.json", true);

  AppendVersion(store, "fraud", "1.0.0");
  AppendVersion(store, "fraud", "1.0.1");
  {
    auto tx = store.Begin(modelreg::testing::kTestLockTimeout);
    (*tx->Mutable().mutable_production_versions())["fraud"] = "1.0.0";
    // Stale flag from the caller must not survive the commit.
    tx->Mutable().mutable_models()->at("fraud").mutable_versions(1)->set_is_production(true);
    tx->Commit();
    assert(tx->IsCommitted());
  }

  JsonFileRegistryStore reopened(dir.Path(), "registry.json", true);
  const auto            registry = reopened.Snapshot();
  const auto&           line     = registry.models().at("fraud");
  assert(line.versions_size() == 2);
  assert(line.versions(0).is_production());
  assert(!line.versions(1).is_production());
  assert(registry.has_last_updated());
  assert(!std::filesystem::exists(modelreg::storage::common::TempPathFor(store.DocumentPath())));
}

void TestUncommittedTransactionLeavesDocumentUntouched() {
  TempDir               dir("rollback");
  JsonFileRegistryStore store(dir.Path(), "registry.json", false);
  AppendVersion(store, "fraud", "1.0.0");

  {
    auto tx = store.Begin(modelreg::testing::kTestLockTimeout);
    *tx->Mutable().mutable_models()->at("fraud").add_versions() = MakeRecord("fraud", "1.0.1");
  }

  assert(store.Snapshot().models().at("fraud").versions_size() == 1);
}

void TestFailedPublishKeepsPreviousDocument() {
  TempDir            dir("atomic_commit");
  FailingPublishStore store(dir.Path(), "registry.json", false);
  AppendVersion(store, "fraud", "1.0.0");

  const auto before = modelreg::util::ToJson(store.Snapshot());

  store.fail_publish = true;
  bool threw         = false;
  try {
    AppendVersion(store, "fraud", "1.0.1");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  assert(modelreg::util::ToJson(store.Snapshot()) == before);
  assert(!std::filesystem::exists(modelreg::storage::common::TempPathFor(store.DocumentPath())));

  // The lock was released on the failure path.
  store.fail_publish = false;
  AppendVersion(store, "fraud", "1.0.1");
  assert(store.Snapshot().models().at("fraud").versions_size() == 2);
}

void TestMalformedDocumentIsCorrupt() {
  TempDir               dir("malformed");
  JsonFileRegistryStore store(dir.Path(), "registry.json", false);

  WriteText(store.DocumentPath(), "{ not json");
  assert(ThrowsCorrupt([&] { store.Snapshot(); }));
  assert(ThrowsCorrupt([&] { store.Begin(modelreg::testing::kTestLockTimeout); }));

  WriteText(store.DocumentPath(), R"({"format_version": 1, "surprise": true})");
  assert(ThrowsCorrupt([&] { store.Snapshot(); }));

  // Corruption is reported, never repaired.
  std::ifstream in(store.DocumentPath());
  std::string   content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(content.find("surprise") != std::string::npos);
}

void TestStructuralViolationsAreCorrupt() {
  TempDir               dir("structural");
  JsonFileRegistryStore store(dir.Path(), "registry.json", false);

  WriteText(store.DocumentPath(), R"({"models": {"fraud": {"versions": [
      {"version": "1.0.1", "model_name": "fraud"}, {"version": "1.0.0", "model_name": "fraud"}]}}})");
  assert(ThrowsCorrupt([&] { store.Snapshot(); }));

  WriteText(store.DocumentPath(), R"({"models": {"fraud": {"versions": [{"version": "1.0", "model_name": "fraud"}]}}})");
  assert(ThrowsCorrupt([&] { store.Snapshot(); }));

  WriteText(store.DocumentPath(), R"({"models": {"fraud": {"versions": [{"version": "1.0.0", "model_name": "churn"}]}}})");
  assert(ThrowsCorrupt([&] { store.Snapshot(); }));

  WriteText(store.DocumentPath(), R"({"models": {"fraud": {"versions": [{"version": "1.0.0", "model_name": "fraud"}]}},
      "production_versions": {"fraud": "2.0.0"}})");
  assert(ThrowsCorrupt([&] { store.Snapshot(); }));

  WriteText(store.DocumentPath(), R"({"format_version": 99})");
  assert(ThrowsCorrupt([&] { store.Snapshot(); }));
}

void TestLegacyDocumentWithoutFormatVersionLoads() {
  TempDir               dir("legacy");
  JsonFileRegistryStore store(dir.Path(), "registry.json", false);

  WriteText(store.DocumentPath(), R"({"models": {"fraud": {"versions": [{"version": "1.0.0", "model_name": "fraud"}]}},
      "production_versions": {"fraud": "1.0.0"}})");

  const auto registry = store.Snapshot();
  assert(registry.models().at("fraud").versions(0).is_production());
}

void TestHeldLockYieldsRegistryBusy() {
  TempDir               dir("busy");
  JsonFileRegistryStore store(dir.Path(), "registry.json", false);

  modelreg::testing::LockHolder holder(store);

  bool       busy       = false;
  const auto started_at = std::chrono::steady_clock::now();
  try {
    (void)store.Begin(std::chrono::milliseconds(50));
  } catch (const modelreg::util::RegistryBusy&) {
    busy = true;
  }
  assert(busy);
  assert(std::chrono::steady_clock::now() - started_at >= std::chrono::milliseconds(50));

  // Readers never wait on writers.
  (void)store.Snapshot();

  holder.Release();
  auto next = store.Begin(std::chrono::milliseconds(50));
  assert(next != nullptr);
}

void TestLockIsSharedAcrossStoreInstances() {
  TempDir               dir("shared_lock");
  JsonFileRegistryStore first(dir.Path(), "registry.json", false);
  JsonFileRegistryStore second(dir.Path(), "registry.json", false);

  modelreg::testing::LockHolder holder(first);

  bool busy = false;
  try {
    (void)second.Begin(std::chrono::milliseconds(20));
  } catch (const modelreg::util::RegistryBusy&) {
    busy = true;
  }
  assert(busy);
}

void TestWaiterAcquiresAfterRelease() {
  TempDir               dir("waiter");
  JsonFileRegistryStore store(dir.Path(), "registry.json", false);

  std::promise<void> locked;
  std::thread        holder([&] {
    auto tx = store.Begin(modelreg::testing::kTestLockTimeout);
    locked.set_value();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  });

  locked.get_future().wait();
  auto tx = store.Begin(modelreg::testing::kTestLockTimeout);
  assert(tx != nullptr);
  holder.join();
}

} // namespace

int main() {
  TestMissingDocumentLoadsEmpty();
  TestCommitPersistsAndRecomputesProductionFlags();
  TestUncommittedTransactionLeavesDocumentUntouched();
  TestFailedPublishKeepsPreviousDocument();
  TestMalformedDocumentIsCorrupt();
  TestStructuralViolationsAreCorrupt();
  TestLegacyDocumentWithoutFormatVersionLoads();
  TestHeldLockYieldsRegistryBusy();
  TestLockIsSharedAcrossStoreInstances();
  TestWaiterAcquiresAfterRelease();

  std::cout << "model_registry_unit_json_file_registry_store: pass\n";
  return 0;
}
