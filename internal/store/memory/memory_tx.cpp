#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/store/document.hpp"

namespace modelreg::store::memory {

MemoryTransaction::MemoryTransaction(MemoryRegistryStore& store, std::unique_lock<std::timed_mutex> writer)
    : store_(store), writer_(std::move(writer)) {
  std::scoped_lock lock(store_.state_mutex_);
  working_ = store_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }

  PrepareForCommit(&working_);

  std::scoped_lock lock(store_.state_mutex_);
  store_.committed_ = working_;
  store_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace modelreg::store::memory
