#include "json_file_registry_store.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/store/document.hpp"
#include "internal/store/file/file_lock.hpp"
#include "internal/store/file/json_file_transaction.hpp"
#include "internal/util/errors.hpp"

namespace modelreg::store::file {

using namespace modelreg::registry::v1;
namespace common = modelreg::storage::common;

JsonFileRegistryStore::JsonFileRegistryStore(std::filesystem::path root, std::string document_name, bool fsync)
    : root_(std::move(root)), document_path_(root_ / document_name), fsync_(fsync) {
  if (document_name.empty()) {
    throw std::invalid_argument("registry document name must not be empty");
  }
  std::filesystem::create_directories(root_);
}

std::string JsonFileRegistryStore::Describe() const {
  return "json-file:" + document_path_.string();
}

Registry JsonFileRegistryStore::Load() const {
  std::error_code ec;
  if (!std::filesystem::exists(document_path_, ec)) {
    if (ec) {
      throw std::runtime_error("cannot stat registry " + document_path_.string() + ": " + ec.message());
    }
    Registry empty;
    empty.set_format_version(kFormatVersion);
    return empty;
  }

  std::shared_ptr<arrow::Buffer> bytes;
  try {
    bytes = common::ReadFile(document_path_);
  } catch (const std::exception& e) {
    throw util::RegistryCorrupt("cannot read registry " + document_path_.string() + ": " + e.what());
  }
  return ParseDocument(bytes->ToString(), document_path_.string());
}

Registry JsonFileRegistryStore::Snapshot() {
  return Load();
}

std::unique_ptr<Transaction> JsonFileRegistryStore::Begin(std::chrono::milliseconds lock_timeout) {
  auto lock    = std::make_unique<FileLock>(FileLock::LockPathFor(document_path_), lock_timeout);
  auto working = Load();
  return std::make_unique<JsonFileTransaction>(*this, std::move(lock), std::move(working));
}

void JsonFileRegistryStore::Publish(const std::filesystem::path& tmp, const std::filesystem::path& document) {
  std::filesystem::rename(tmp, document);
  if (fsync_) {
    common::SyncDirectory(document.parent_path());
  }
}

void JsonFileRegistryStore::Store(Registry* registry) {
  PrepareForCommit(registry);
  const auto json = SerializeDocument(*registry);
  const auto tmp  = common::TempPathFor(document_path_);

  try {
    common::WriteFile(tmp, json, fsync_);
    Publish(tmp, document_path_);
  } catch (...) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw;
  }

  MODELREG_LOG_DEBUG("registry committed", {observability::StringField("document", document_path_.string()),
                                            observability::IntField("models", registry->models_size())});
}

} // namespace modelreg::store::file
