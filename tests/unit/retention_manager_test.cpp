#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "fake_artifact_store.hpp"
#include "internal/core/promotion_manager.hpp"
#include "internal/core/retention_manager.hpp"
#include "internal/store/memory/memory_registry_store.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using modelreg::core::PromotionManager;
using modelreg::core::RetentionManager;
using modelreg::testing::FaultyArtifactStore;
using namespace modelreg::registry::v1;

struct Fixture {
  std::shared_ptr<modelreg::store::memory::MemoryRegistryStore> store     = std::make_shared<modelreg::store::memory::MemoryRegistryStore>();
  std::shared_ptr<FaultyArtifactStore>                          artifacts = std::make_shared<FaultyArtifactStore>();
  PromotionManager promotion{store, artifacts, modelreg::testing::kTestLockTimeout};
  RetentionManager retention{store, artifacts, modelreg::testing::kTestLockTimeout};

  void RegisterMany(const std::string& model_name, int count) {
    for (int i = 0; i < count; ++i) {
      promotion.Register(modelreg::testing::MakeRequest(model_name), arrow::Buffer::FromString("w"));
    }
  }

  std::vector<std::string> Versions(const std::string& model_name) {
    std::vector<std::string> versions;
    for (const auto& record : store->Snapshot().models().at(model_name).versions()) {
      versions.push_back(record.version());
    }
    return versions;
  }
};

void TestKeepsRecentAndProduction() {
  Fixture f;
  f.RegisterMany("risk_scorer", 3);
  f.promotion.Promote("risk_scorer", "1.0.1");

  const auto report = f.retention.Cleanup("risk_scorer", 1, true);
  assert(report.removed_count() == 1);
  assert(report.removed_versions_size() == 1 && report.removed_versions(0) == "1.0.0");
  assert(report.failures().empty());
  assert((f.Versions("risk_scorer") == std::vector<std::string>{"1.0.1", "1.0.2"}));
  assert(f.artifacts->removed.contains("1.0.0"));
  assert(f.store->Snapshot().production_versions().at("risk_scorer") == "1.0.1");
}

void TestProtectsOldestProduction() {
  Fixture f;
  f.RegisterMany("fraud", 5);
  f.promotion.Promote("fraud", "1.0.0");

  const auto report = f.retention.Cleanup("fraud", 2);
  assert(report.removed_count() == 2);
  assert((f.Versions("fraud") == std::vector<std::string>{"1.0.0", "1.0.3", "1.0.4"}));
  assert(f.store->Snapshot().models().at("fraud").versions(0).is_production());
}

void TestWithoutKeepProductionClearsPointer() {
  Fixture f;
  f.RegisterMany("fraud", 3);
  f.promotion.Promote("fraud", "1.0.0");

  const auto report = f.retention.Cleanup("fraud", 1, false);
  assert(report.removed_count() == 2);
  assert((f.Versions("fraud") == std::vector<std::string>{"1.0.2"}));
  assert(!f.store->Snapshot().production_versions().contains("fraud"));
}

void TestNothingToRemoveSkipsCommit() {
  Fixture f;
  f.RegisterMany("fraud", 2);

  const auto commits = f.store->CommittedVersion();
  const auto report  = f.retention.Cleanup("fraud", 5);
  assert(report.removed_count() == 0);
  assert(f.store->CommittedVersion() == commits);
}

void TestDeleteFailureIsReportedPerRecord() {
  Fixture f;
  f.RegisterMany("fraud", 4);
  f.artifacts->fail_removes.insert("1.0.1");

  const auto report = f.retention.Cleanup("fraud", 1);
  assert(report.removed_count() == 2);
  assert(report.failures_size() == 1);
  assert(report.failures(0).version() == "1.0.1");
  assert(!report.failures(0).error().empty());
  assert((f.Versions("fraud") == std::vector<std::string>{"1.0.1", "1.0.3"}));
}

void TestVersionsAreNeverReissuedAfterCleanup() {
  Fixture f;
  f.RegisterMany("fraud", 3);
  f.retention.Cleanup("fraud", 1);

  const auto next = f.promotion.Register(modelreg::testing::MakeRequest("fraud"), arrow::Buffer::FromString("w"));
  assert(next.version() == "1.0.3");
}

void TestArgumentErrors() {
  Fixture f;
  f.RegisterMany("fraud", 1);

  bool threw = false;
  try {
    f.retention.Cleanup("fraud", 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.retention.Cleanup("missing", 1);
  } catch (const modelreg::util::ModelNotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestKeepsRecentAndProduction();
  TestProtectsOldestProduction();
  TestWithoutKeepProductionClearsPointer();
  TestNothingToRemoveSkipsCommit();
  TestDeleteFailureIsReportedPerRecord();
  TestVersionsAreNeverReissuedAfterCleanup();
  TestArgumentErrors();

  std::cout << "model_registry_unit_retention_manager: pass\n";
  return 0;
}
