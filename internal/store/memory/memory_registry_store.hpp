#pragma once

#include <cstdint>
#include <mutex>

#include "internal/store/api/registry_store.hpp"

namespace modelreg::store::memory {

/*
  In-process registry. Same transaction semantics as the file store without
  persistence; used by tests and ephemeral registries.
*/
class MemoryRegistryStore final : public RegistryStore {
 public:
  MemoryRegistryStore();

  std::unique_ptr<Transaction> Begin(std::chrono::milliseconds lock_timeout) override;

  modelreg::registry::v1::Registry Snapshot() override;

  std::string Describe() const override {
    return "memory";
  }

  uint64_t CommittedVersion() const;

 private:
  friend class MemoryTransaction;

  // held by the open transaction
  std::timed_mutex writer_mutex_;

  mutable std::mutex               state_mutex_;
  modelreg::registry::v1::Registry committed_;
  uint64_t                         committed_version_ = 0;
};

} // namespace modelreg::store::memory
