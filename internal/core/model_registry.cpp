#include "model_registry.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/document.hpp"
#include "internal/util/error_status.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace modelreg::core {

using namespace modelreg::registry::v1;
using observability::StringField;

namespace {

constexpr std::size_t kSummaryMetricLimit = 3;

void RecordOutcome(std::string_view operation, bool success, std::chrono::steady_clock::time_point started_at) {
  auto& metrics = observability::Metrics::Instance();
  metrics.RecordOperation(operation, success);
  metrics.ObserveOperationLatencyMs(operation, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
}

template <typename Fn>
auto ObserveOperation(std::string_view operation, const std::string& model_name, Fn&& fn) {
  observability::SpanScope span(operation);
  if (!model_name.empty()) {
    span.SetAttribute("model.name", model_name);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      RecordOutcome(operation, true, started_at);
      return;
    } else {
      auto result = fn();
      RecordOutcome(operation, true, started_at);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    observability::Log(util::IsRequestError(ex) ? spdlog::level::warn : spdlog::level::err, "registry operation failed",
                       {StringField("operation", operation), StringField("model", model_name), StringField("error", ex.what()),
                        StringField("kind", util::ErrorName(ex))});
    RecordOutcome(operation, false, started_at);
    throw;
  }
}

const VersionRecord& LatestRecord(const ModelLine& line, const std::string& model_name) {
  if (line.versions().empty()) {
    throw util::VersionNotFound("model '" + model_name + "' has no versions");
  }
  return line.versions(line.versions_size() - 1);
}

} // namespace

ModelRegistry::ModelRegistry(store::RegistryStorePtr store, storage::ArtifactStorePtr artifacts, std::chrono::milliseconds lock_timeout)
    : store_(store), artifacts_(artifacts), promotion_(store, artifacts, lock_timeout), retention_(store, artifacts, lock_timeout), lineage_(store) {
}

VersionRecord ModelRegistry::Register(const RegisterModelRequest& request, const std::shared_ptr<arrow::Buffer>& artifact) {
  return ObserveOperation("ModelRegistry.Register", request.model_name(), [&] { return promotion_.Register(request, artifact); });
}

VersionRecord ModelRegistry::Register(const RegisterModelRequest& request, const std::string& artifact) {
  return Register(request, arrow::Buffer::FromString(artifact));
}

void ModelRegistry::Promote(const std::string& model_name, const std::string& version) {
  ObserveOperation("ModelRegistry.Promote", model_name, [&] { promotion_.Promote(model_name, version); });
}

void ModelRegistry::Deprecate(const std::string& model_name, const std::string& version) {
  ObserveOperation("ModelRegistry.Deprecate", model_name, [&] { promotion_.Deprecate(model_name, version); });
}

void ModelRegistry::Archive(const std::string& model_name, const std::string& version) {
  ObserveOperation("ModelRegistry.Archive", model_name, [&] { promotion_.Archive(model_name, version); });
}

LoadedModel ModelRegistry::Fetch(const VersionRecord& record) {
  LoadedModel loaded;
  loaded.record = record;
  loaded.bytes  = artifacts_->Read(record.artifact_locator());
  return loaded;
}

LoadedModel ModelRegistry::Load(const std::string& model_name, const std::optional<std::string>& version) {
  return ObserveOperation("ModelRegistry.Load", model_name, [&] {
    const auto registry = store_->Snapshot();
    if (version) {
      return Fetch(store::RequireVersion(registry, model_name, *version));
    }

    const auto& line = store::RequireLine(registry, model_name);
    if (const auto production = store::ProductionVersion(registry, model_name)) {
      return Fetch(store::RequireVersion(registry, model_name, *production));
    }
    return Fetch(LatestRecord(line, model_name));
  });
}

LoadedModel ModelRegistry::GetProductionArtifact(const std::string& model_name) {
  return ObserveOperation("ModelRegistry.GetProductionArtifact", model_name, [&] {
    const auto registry = store_->Snapshot();
    store::RequireLine(registry, model_name);

    const auto production = store::ProductionVersion(registry, model_name);
    if (!production) {
      throw util::NoProductionModel("model '" + model_name + "' has no production version");
    }
    return Fetch(store::RequireVersion(registry, model_name, *production));
  });
}

ProductionModels ModelRegistry::GetProductionModels() {
  return ObserveOperation("ModelRegistry.GetProductionModels", "", [&] {
    const auto registry = store_->Snapshot();

    std::vector<std::pair<std::string, std::string>> pointers(registry.production_versions().begin(), registry.production_versions().end());
    std::sort(pointers.begin(), pointers.end());

    ProductionModels result;
    for (const auto& [model_name, version] : pointers) {
      try {
        result.models.push_back(Fetch(store::RequireVersion(registry, model_name, version)));
      } catch (const std::exception& ex) {
        MODELREG_LOG_WARN("failed to load production model",
                          {StringField("model", model_name), StringField("version", version), StringField("error", ex.what())});
        result.failures.push_back({model_name, version, ex.what()});
      }
    }
    return result;
  });
}

std::vector<VersionRecord> ModelRegistry::List(const std::optional<std::string>& model_name, const std::optional<VersionStatus>& status) {
  return ObserveOperation("ModelRegistry.List", model_name.value_or(""), [&] {
    const auto registry = store_->Snapshot();

    std::vector<std::string> names;
    for (const auto& [name, line] : registry.models()) {
      if (!model_name || name == *model_name) {
        names.push_back(name);
      }
    }
    std::sort(names.begin(), names.end());

    std::vector<VersionRecord> records;
    for (const auto& name : names) {
      for (const auto& record : registry.models().at(name).versions()) {
        if (status && record.status() != *status) {
          continue;
        }
        records.push_back(record);
      }
    }
    return records;
  });
}

LineageReport ModelRegistry::ExportLineage(const std::string& model_name) {
  return ObserveOperation("ModelRegistry.ExportLineage", model_name, [&] { return lineage_.Export(model_name); });
}

LineageReport ModelRegistry::ExportLineageToFile(const std::string& model_name, const std::filesystem::path& output_path) {
  return ObserveOperation("ModelRegistry.ExportLineageToFile", model_name, [&] { return lineage_.ExportToFile(model_name, output_path); });
}

VersionComparison ModelRegistry::CompareVersions(const std::string& model_name, const std::string& version1, const std::string& version2) {
  return ObserveOperation("ModelRegistry.CompareVersions", model_name, [&] {
    const auto  registry = store_->Snapshot();
    const auto& v1       = store::RequireVersion(registry, model_name, version1);
    const auto& v2       = store::RequireVersion(registry, model_name, version2);

    VersionComparison comparison;
    comparison.set_model_name(model_name);
    comparison.set_version1(version1);
    comparison.set_version2(version2);
    comparison.set_created_at_diff_days(util::DaysBetween(v1.created_at(), v2.created_at()));
    comparison.set_training_samples_diff(static_cast<int64_t>(v2.training_samples()) - static_cast<int64_t>(v1.training_samples()));
    comparison.set_feature_count_diff(static_cast<int64_t>(v2.feature_count()) - static_cast<int64_t>(v1.feature_count()));

    auto& metrics = *comparison.mutable_metrics();
    for (const auto& [name, value] : v1.metrics()) {
      metrics[name].set_v1(value);
    }
    for (const auto& [name, value] : v2.metrics()) {
      metrics[name].set_v2(value);
    }
    for (auto& [name, delta] : metrics) {
      delta.set_diff(delta.v2() - delta.v1());
      delta.set_improved(delta.v2() > delta.v1());
    }
    return comparison;
  });
}

RegistrySummary ModelRegistry::Summary() {
  return ObserveOperation("ModelRegistry.Summary", "", [&] {
    const auto registry = store_->Snapshot();

    std::vector<std::string> names;
    for (const auto& [name, line] : registry.models()) {
      names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    RegistrySummary summary;
    *summary.mutable_generated_at() = util::ToProto(util::Now());
    summary.set_total_models(static_cast<uint32_t>(names.size()));

    uint32_t total_versions = 0;
    for (const auto& name : names) {
      const auto& line = registry.models().at(name);
      total_versions += static_cast<uint32_t>(line.versions_size());

      auto* model = summary.add_models();
      model->set_model_name(name);
      model->set_version_count(static_cast<uint32_t>(line.versions_size()));
      model->set_production_version(store::ProductionVersion(registry, name).value_or(""));
      if (line.versions().empty()) {
        continue;
      }

      const auto& latest = line.versions(line.versions_size() - 1);
      model->set_latest_version(latest.version());
      *model->mutable_latest_created_at() = latest.created_at();

      std::vector<std::string> metric_names;
      for (const auto& [metric, value] : latest.metrics()) {
        metric_names.push_back(metric);
      }
      std::sort(metric_names.begin(), metric_names.end());
      if (metric_names.size() > kSummaryMetricLimit) {
        metric_names.resize(kSummaryMetricLimit);
      }
      for (const auto& metric : metric_names) {
        (*model->mutable_latest_metrics())[metric] = latest.metrics().at(metric);
      }
    }
    summary.set_total_versions(total_versions);
    return summary;
  });
}

CleanupReport ModelRegistry::Cleanup(const std::string& model_name, uint32_t keep_last_n, bool keep_production) {
  return ObserveOperation("ModelRegistry.Cleanup", model_name, [&] { return retention_.Cleanup(model_name, keep_last_n, keep_production); });
}

} // namespace modelreg::core
