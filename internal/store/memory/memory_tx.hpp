#pragma once

#include "internal/store/api/transaction.hpp"
#include "memory_registry_store.hpp"

namespace modelreg::store::memory {

/*
  Transaction = writer lock + snapshot copy
*/
class MemoryTransaction final : public Transaction {
 public:
  // Takes ownership of an already locked writer mutex.
  MemoryTransaction(MemoryRegistryStore& store, std::unique_lock<std::timed_mutex> writer);
  ~MemoryTransaction() override;

  modelreg::registry::v1::Registry& Mutable() override {
    return working_;
  }
  const modelreg::registry::v1::Registry& View() const override {
    return working_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  MemoryRegistryStore&               store_;
  std::unique_lock<std::timed_mutex> writer_;
  modelreg::registry::v1::Registry   working_;
  bool                               committed_   = false;
  bool                               rolled_back_ = false;
};

} // namespace modelreg::store::memory
