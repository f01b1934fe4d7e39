#pragma once

#include "modelreg/registry/v1/registry.pb.h"

namespace modelreg::store {

/*
  Read-modify-commit unit against the registry document.

  Semantics guaranteed for ALL backends:

  - The exclusive registry lock is held from Begin() until the transaction
    is destroyed, whatever path the caller leaves by
  - Mutable() starts as the last committed document
  - Changes are invisible until Commit()
  - Commit() is all-or-nothing: on failure the prior document is intact
  - Destructor MUST rollback if not committed

  File:   flock + write tmp → rename
  Memory: snapshot copy-on-write
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual modelreg::registry::v1::Registry&       Mutable()    = 0;
  virtual const modelreg::registry::v1::Registry& View() const = 0;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace modelreg::store
