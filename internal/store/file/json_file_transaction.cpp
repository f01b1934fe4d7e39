#include "json_file_transaction.hpp"

#include <stdexcept>

#include "internal/store/file/json_file_registry_store.hpp"

namespace modelreg::store::file {

JsonFileTransaction::JsonFileTransaction(JsonFileRegistryStore& store, std::unique_ptr<FileLock> lock, modelreg::registry::v1::Registry working)
    : store_(store), lock_(std::move(lock)), working_(std::move(working)) {
}

JsonFileTransaction::~JsonFileTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void JsonFileTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  store_.Store(&working_);
  committed_ = true;
}

void JsonFileTransaction::Rollback() {
  // Nothing was written; dropping the working copy is enough.
  rolled_back_ = true;
}

} // namespace modelreg::store::file
