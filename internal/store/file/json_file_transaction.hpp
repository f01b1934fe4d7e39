#pragma once

#include <memory>

#include "internal/store/api/transaction.hpp"
#include "internal/store/file/file_lock.hpp"

namespace modelreg::store::file {

class JsonFileRegistryStore;

/*
  Transaction = held lock + working copy of the document
*/
class JsonFileTransaction final : public Transaction {
 public:
  JsonFileTransaction(JsonFileRegistryStore& store, std::unique_ptr<FileLock> lock, modelreg::registry::v1::Registry working);
  ~JsonFileTransaction() override;

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
  JsonFileRegistryStore&           store_;
  std::unique_ptr<FileLock>        lock_;
  modelreg::registry::v1::Registry working_;
  bool                             committed_   = false;
  bool                             rolled_back_ = false;
};

} // namespace modelreg::store::file
