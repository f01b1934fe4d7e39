#include "promotion_manager.hpp"

#include <stdexcept>

#include "internal/core/version_allocator.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/store/document.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace modelreg::core {

using namespace modelreg::registry::v1;
using observability::StringField;

namespace {

std::string StatusName(VersionStatus status) {
  switch (status) {
    case VERSION_STATUS_ACTIVE:
      return "active";
    case VERSION_STATUS_DEPRECATED:
      return "deprecated";
    case VERSION_STATUS_ARCHIVED:
      return "archived";
    default:
      return "unspecified";
  }
}

VersionRecord BuildRecord(const RegisterModelRequest& request, const std::string& version) {
  VersionRecord record;
  record.set_version(version);
  record.set_model_name(request.model_name());
  record.set_model_type(request.model_type());
  *record.mutable_created_at() = util::ToProto(util::Now());
  record.set_created_by(request.created_by().empty() ? "system" : request.created_by());
  record.set_description(request.description());
  *record.mutable_metrics() = request.metrics();
  record.set_training_data_hash(request.training_data_hash());
  record.set_training_samples(request.training_samples());
  record.set_feature_count(request.feature_count());
  record.set_training_duration_seconds(request.training_duration_seconds());
  record.set_status(VERSION_STATUS_ACTIVE);
  record.set_is_production(false);
  *record.mutable_tags() = request.tags();
  return record;
}

} // namespace

PromotionManager::PromotionManager(store::RegistryStorePtr store, storage::ArtifactStorePtr artifacts, std::chrono::milliseconds lock_timeout)
    : store_(std::move(store)), artifacts_(std::move(artifacts)), lock_timeout_(lock_timeout) {
  if (!store_ || !artifacts_) {
    throw std::invalid_argument("promotion manager requires a registry store and an artifact store");
  }
}

VersionRecord PromotionManager::Register(const RegisterModelRequest& request, const std::shared_ptr<arrow::Buffer>& artifact) {
  storage::common::ValidateModelName(request.model_name());
  if (!artifact) {
    throw std::invalid_argument("register " + request.model_name() + ": artifact bytes are required");
  }

  auto  tx       = store_->Begin(lock_timeout_);
  auto& registry = tx->Mutable();
  auto& line     = (*registry.mutable_models())[request.model_name()];

  const auto version = VersionAllocator::NextVersion(line, request.bump());

  auto record = BuildRecord(request, version);
  record.set_artifact_locator(artifacts_->Write(request.model_name(), version, artifact));
  record.set_artifact_size_bytes(static_cast<uint64_t>(artifact->size()));

  try {
    artifacts_->WriteSidecar(record);
    *line.add_versions() = record;
    tx->Commit();
  } catch (...) {
    try {
      artifacts_->Remove(request.model_name(), version);
    } catch (const util::ArtifactDeleteFailed& cleanup) {
      MODELREG_LOG_WARN("orphaned artifact left after failed registration",
                        {StringField("model", request.model_name()), StringField("version", version), StringField("error", cleanup.what())});
    }
    throw;
  }

  MODELREG_LOG_INFO("model registered", {StringField("model", record.model_name()), StringField("version", version),
                                         StringField("locator", record.artifact_locator()),
                                         observability::IntField("size_bytes", static_cast<int64_t>(record.artifact_size_bytes()))});
  return record;
}

void PromotionManager::Promote(const std::string& model_name, const std::string& version) {
  auto  tx       = store_->Begin(lock_timeout_);
  auto& registry = tx->Mutable();

  const auto& record = store::RequireVersion(registry, model_name, version);
  if (!model::CanHoldProduction(record.status())) {
    throw util::InvalidState("cannot promote " + model_name + " " + version + ": version is " + StatusName(record.status()));
  }

  const auto previous = store::ProductionVersion(registry, model_name);
  if (previous && *previous == version) {
    MODELREG_LOG_INFO("version already in production", {StringField("model", model_name), StringField("version", version)});
    return;
  }

  (*registry.mutable_production_versions())[model_name] = version;
  store::SyncProductionFlags(&registry);
  tx->Commit();

  RefreshSidecar(record);
  if (previous) {
    if (const auto* demoted = store::FindVersion(registry.models().at(model_name), *previous)) {
      RefreshSidecar(*demoted);
    }
  }

  MODELREG_LOG_INFO("model promoted",
                    {StringField("model", model_name), StringField("version", version), StringField("previous", previous.value_or(""))});
  if (record.status() == VERSION_STATUS_DEPRECATED) {
    MODELREG_LOG_WARN("deprecated version is in production", {StringField("model", model_name), StringField("version", version)});
  }
}

void PromotionManager::Deprecate(const std::string& model_name, const std::string& version) {
  if (!Transition(model_name, version, VERSION_STATUS_DEPRECATED)) {
    return;
  }
  MODELREG_LOG_INFO("model deprecated", {StringField("model", model_name), StringField("version", version)});
}

void PromotionManager::Archive(const std::string& model_name, const std::string& version) {
  if (!Transition(model_name, version, VERSION_STATUS_ARCHIVED)) {
    return;
  }
  MODELREG_LOG_INFO("model archived", {StringField("model", model_name), StringField("version", version)});
}

// The registry document is authoritative; a stale sidecar is only worth a warning.
void PromotionManager::RefreshSidecar(const VersionRecord& record) {
  try {
    artifacts_->WriteSidecar(record);
  } catch (const util::ArtifactWriteFailed& e) {
    MODELREG_LOG_WARN("sidecar not refreshed",
                      {StringField("model", record.model_name()), StringField("version", record.version()), StringField("error", e.what())});
  }
}

bool PromotionManager::Transition(const std::string& model_name, const std::string& version, VersionStatus target) {
  auto  tx       = store_->Begin(lock_timeout_);
  auto& registry = tx->Mutable();
  auto& record   = store::RequireVersion(&registry, model_name, version);

  if (record.status() == target) {
    return false;
  }
  if (!model::CanTransition(record.status(), target)) {
    throw util::InvalidState("cannot move " + model_name + " " + version + " from " + StatusName(record.status()) + " to " + StatusName(target));
  }

  const auto production = store::ProductionVersion(registry, model_name);
  const bool in_production = production && *production == version;
  if (in_production && !model::CanHoldProduction(target)) {
    throw util::InvalidState("cannot archive " + model_name + " " + version + ": version is in production; promote another version first");
  }

  record.set_status(target);
  tx->Commit();
  RefreshSidecar(record);

  if (in_production) {
    MODELREG_LOG_WARN("deprecated version is in production", {StringField("model", model_name), StringField("version", version)});
  }
  return true;
}

} // namespace modelreg::core
