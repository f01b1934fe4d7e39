#include "retention_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/document.hpp"
#include "internal/util/errors.hpp"

namespace modelreg::core {

using namespace modelreg::registry::v1;
using observability::StringField;

RetentionManager::RetentionManager(store::RegistryStorePtr store, storage::ArtifactStorePtr artifacts, std::chrono::milliseconds lock_timeout)
    : store_(std::move(store)), artifacts_(std::move(artifacts)), lock_timeout_(lock_timeout) {
  if (!store_ || !artifacts_) {
    throw std::invalid_argument("retention manager requires a registry store and an artifact store");
  }
}

CleanupReport RetentionManager::Cleanup(const std::string& model_name, uint32_t keep_last_n, bool keep_production) {
  if (keep_last_n == 0) {
    throw std::invalid_argument("cleanup " + model_name + ": keep_last_n must be at least 1");
  }

  auto  tx       = store_->Begin(lock_timeout_);
  auto& registry = tx->Mutable();
  auto& line     = store::RequireLine(&registry, model_name);

  CleanupReport report;
  report.set_model_name(model_name);

  const auto production = store::ProductionVersion(registry, model_name);
  const int  total      = line.versions_size();
  const int  first_kept = total > static_cast<int>(keep_last_n) ? total - static_cast<int>(keep_last_n) : 0;

  ModelLine kept;
  bool      production_removed = false;
  for (int i = 0; i < total; ++i) {
    const auto& record = line.versions(i);

    const bool recent        = i >= first_kept;
    const bool is_production = production && *production == record.version();
    if (recent || (keep_production && is_production)) {
      *kept.add_versions() = record;
      continue;
    }

    try {
      artifacts_->Remove(model_name, record.version());
    } catch (const util::ArtifactDeleteFailed& ex) {
      MODELREG_LOG_WARN("artifact delete failed; version kept",
                        {StringField("model", model_name), StringField("version", record.version()), StringField("error", ex.what())});
      auto* failure = report.add_failures();
      failure->set_version(record.version());
      failure->set_error(ex.what());
      *kept.add_versions() = record;
      continue;
    }

    report.add_removed_versions(record.version());
    production_removed = production_removed || is_production;
  }

  report.set_removed_count(static_cast<uint32_t>(report.removed_versions_size()));
  if (report.removed_count() == 0) {
    MODELREG_LOG_INFO("cleanup found nothing to remove", {StringField("model", model_name)});
    return report;
  }

  line.Swap(&kept);
  if (production_removed) {
    registry.mutable_production_versions()->erase(model_name);
  }
  tx->Commit();

  observability::Metrics::Instance().RecordArtifactsRemoved(model_name, report.removed_count());
  MODELREG_LOG_INFO("cleanup completed", {StringField("model", model_name), observability::IntField("removed", report.removed_count()),
                                          observability::IntField("failed", report.failures_size()),
                                          observability::BoolField("production_cleared", production_removed)});
  return report;
}

} // namespace modelreg::core
