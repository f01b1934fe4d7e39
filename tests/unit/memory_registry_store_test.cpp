#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/store/memory/memory_registry_store.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using modelreg::store::memory::MemoryRegistryStore;
using namespace modelreg::registry::v1;

void TestChangesInvisibleUntilCommit() {
  MemoryRegistryStore store;

  auto tx = store.Begin(modelreg::testing::kTestLockTimeout);
  auto* record = (*tx->Mutable().mutable_models())["fraud"].add_versions();
  record->set_model_name("fraud");
  record->set_version("1.0.0");

  assert(store.Snapshot().models().empty());
  tx->Commit();
  assert(store.Snapshot().models().at("fraud").versions_size() == 1);
  assert(store.CommittedVersion() == 1);
}

void TestRollbackOnDestruction() {
  MemoryRegistryStore store;
  {
    auto tx = store.Begin(modelreg::testing::kTestLockTimeout);
    (*tx->Mutable().mutable_production_versions())["fraud"] = "1.0.0";
  }
  assert(store.Snapshot().production_versions().empty());
  assert(store.CommittedVersion() == 0);
}

void TestCommitSyncsProductionFlags() {
  MemoryRegistryStore store;

  auto  tx     = store.Begin(modelreg::testing::kTestLockTimeout);
  auto& line   = (*tx->Mutable().mutable_models())["fraud"];
  auto* first  = line.add_versions();
  auto* second = line.add_versions();
  first->set_version("1.0.0");
  second->set_version("1.0.1");
  first->set_is_production(true);
  (*tx->Mutable().mutable_production_versions())["fraud"] = "1.0.1";
  tx->Commit();

  const auto snapshot = store.Snapshot();
  assert(!snapshot.models().at("fraud").versions(0).is_production());
  assert(snapshot.models().at("fraud").versions(1).is_production());
}

void TestHeldLockYieldsRegistryBusy() {
  MemoryRegistryStore store;
  modelreg::testing::LockHolder holder(store);

  bool busy = false;
  try {
    (void)store.Begin(std::chrono::milliseconds(20));
  } catch (const modelreg::util::RegistryBusy&) {
    busy = true;
  }
  assert(busy);

  holder.Release();
  assert(store.Begin(std::chrono::milliseconds(20)) != nullptr);
}

void TestConcurrentWritersDoNotLoseUpdates() {
  MemoryRegistryStore store;
  constexpr int       kThreads   = 8;
  constexpr int       kPerThread = 25;

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&store] {
      for (int i = 0; i < kPerThread; ++i) {
        auto  tx   = store.Begin(std::chrono::seconds(10));
        auto& line = (*tx->Mutable().mutable_models())["counter"];
        line.add_versions()->set_version("1.0." + std::to_string(line.versions_size()));
        tx->Commit();
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  assert(store.Snapshot().models().at("counter").versions_size() == kThreads * kPerThread);
}

} // namespace

int main() {
  TestChangesInvisibleUntilCommit();
  TestRollbackOnDestruction();
  TestCommitSyncsProductionFlags();
  TestHeldLockYieldsRegistryBusy();
  TestConcurrentWritersDoNotLoseUpdates();

  std::cout << "model_registry_unit_memory_registry_store: pass\n";
  return 0;
}
