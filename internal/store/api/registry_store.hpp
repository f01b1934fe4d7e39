#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/store/api/transaction.hpp"
#include "modelreg/registry/v1/registry.pb.h"

namespace modelreg::store {

/*
  Registry store abstraction.

  CRITICAL GUARANTEES:

  - All writes go through a Transaction
  - Begin() serializes writers per registry document with a bounded wait;
    timeout throws util::RegistryBusy
  - Snapshot() never blocks on writers and always observes one complete
    committed document
  - Loading a missing document yields an empty registry; a malformed one
    throws util::RegistryCorrupt
  - VersionRecord.is_production is recomputed from production_versions on
    every load and commit

  The store is the source of truth for:
    model lines
    production pointers
*/

class RegistryStore {
 public:
  virtual ~RegistryStore() = default;

  virtual std::unique_ptr<Transaction> Begin(std::chrono::milliseconds lock_timeout) = 0;

  virtual modelreg::registry::v1::Registry Snapshot() = 0;

  virtual std::string Describe() const = 0;
};

using RegistryStorePtr = std::shared_ptr<RegistryStore>;

} // namespace modelreg::store
