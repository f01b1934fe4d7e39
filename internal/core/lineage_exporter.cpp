#include "lineage_exporter.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/store/document.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"

namespace modelreg::core {

using namespace modelreg::registry::v1;

LineageExporter::LineageExporter(store::RegistryStorePtr store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("lineage exporter requires a registry store");
  }
}

LineageReport LineageExporter::Build(const Registry& registry, const std::string& model_name) {
  const auto& line = store::RequireLine(registry, model_name);

  LineageReport report;
  report.set_model_name(model_name);
  *report.mutable_generated_at() = util::ToProto(util::Now());
  report.set_total_versions(static_cast<uint32_t>(line.versions_size()));
  report.set_production_version(store::ProductionVersion(registry, model_name).value_or(""));
  *report.mutable_version_history() = line.versions();
  return report;
}

LineageReport LineageExporter::Export(const std::string& model_name) const {
  return Build(store_->Snapshot(), model_name);
}

LineageReport LineageExporter::ExportToFile(const std::string& model_name, const std::filesystem::path& output_path) const {
  auto report = Export(model_name);

  if (output_path.has_parent_path()) {
    std::filesystem::create_directories(output_path.parent_path());
  }
  storage::common::AtomicReplace(output_path, util::ToJson(report), true);

  MODELREG_LOG_INFO("lineage exported", {observability::StringField("model", model_name), observability::StringField("path", output_path.string()),
                                         observability::IntField("versions", report.total_versions())});
  return report;
}

} // namespace modelreg::core
