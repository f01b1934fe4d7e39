#include "memory_registry_store.hpp"

#include "internal/store/document.hpp"
#include "internal/store/memory/memory_tx.hpp"
#include "internal/util/errors.hpp"

namespace modelreg::store::memory {

MemoryRegistryStore::MemoryRegistryStore() {
  committed_.set_format_version(kFormatVersion);
}

std::unique_ptr<Transaction> MemoryRegistryStore::Begin(std::chrono::milliseconds lock_timeout) {
  std::unique_lock<std::timed_mutex> writer(writer_mutex_, std::defer_lock);
  if (!writer.try_lock_for(lock_timeout)) {
    throw util::RegistryBusy("in-memory registry lock not acquired within " + std::to_string(lock_timeout.count()) + " ms");
  }
  return std::make_unique<MemoryTransaction>(*this, std::move(writer));
}

modelreg::registry::v1::Registry MemoryRegistryStore::Snapshot() {
  std::scoped_lock lock(state_mutex_);
  return committed_;
}

uint64_t MemoryRegistryStore::CommittedVersion() const {
  std::scoped_lock lock(state_mutex_);
  return committed_version_;
}

} // namespace modelreg::store::memory
