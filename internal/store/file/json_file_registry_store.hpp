#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/store/api/registry_store.hpp"

namespace modelreg::store::file {

class FileLock;

/*
  Registry persisted as one JSON document: <root>/<document_name>.

  Writers: FileLock, read, mutate, write "<document>.tmp", rename over the
  document, fsync the directory.
  Readers: read the document without locking. rename() is atomic, so a
  reader sees the previous or the next committed version.
*/
class JsonFileRegistryStore : public RegistryStore {
 public:
  JsonFileRegistryStore(std::filesystem::path root, std::string document_name, bool fsync);

  std::unique_ptr<Transaction> Begin(std::chrono::milliseconds lock_timeout) override;

  modelreg::registry::v1::Registry Snapshot() override;

  std::string Describe() const override;

  const std::filesystem::path& DocumentPath() const {
    return document_path_;
  }

 protected:
  // Final step of a commit: make `tmp` the live document.
  virtual void Publish(const std::filesystem::path& tmp, const std::filesystem::path& document);

 private:
  friend class JsonFileTransaction;

  modelreg::registry::v1::Registry Load() const;
  void                             Store(modelreg::registry::v1::Registry* registry);

  std::filesystem::path root_;
  std::filesystem::path document_path_;
  bool                  fsync_;
};

} // namespace modelreg::store::file
