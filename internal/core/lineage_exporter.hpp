#pragma once

#include <filesystem>
#include <string>

#include "internal/store/api/registry_store.hpp"
#include "modelreg/registry/v1/reports.pb.h"

namespace modelreg::core {

/*
  Read-only audit projection of a model line.

  Works from one committed snapshot; never takes the writer lock.
*/
class LineageExporter {
 public:
  explicit LineageExporter(store::RegistryStorePtr store);

  // Every record in creation order. Throws util::ModelNotFound.
  modelreg::registry::v1::LineageReport Export(const std::string& model_name) const;

  // Static projection used by Export; exposed for callers holding a snapshot.
  static modelreg::registry::v1::LineageReport Build(const modelreg::registry::v1::Registry& registry, const std::string& model_name);

  // Indented JSON, written tmp -> rename. Parent directories are created.
  modelreg::registry::v1::LineageReport ExportToFile(const std::string& model_name, const std::filesystem::path& output_path) const;

 private:
  store::RegistryStorePtr store_;
};

} // namespace modelreg::core
