#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/version_allocator.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/arg_parse.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/error_status.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "modelreg/registry/v1.hpp"

using namespace modelreg::registry::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  modelregctl [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "  register <model> <type> <artifact_file> [--bump major|minor|patch] [--description <text>]\n"
            << "           [--created-by <who>] [--metric <name>=<value>]... [--tag <tag>]...\n"
            << "           [--data-hash <hash>] [--samples <n>] [--features <n>] [--duration <seconds>]\n"
            << "  promote <model> <version>\n"
            << "  deprecate <model> <version>\n"
            << "  archive <model> <version>\n"
            << "  list [model] [--status active|deprecated|archived]\n"
            << "  show <model> [version] [--output <artifact_file>]\n"
            << "  production [model]\n"
            << "  lineage <model> [output_file]\n"
            << "  compare <model> <version1> <version2>\n"
            << "  cleanup <model> [keep_last_n] [--no-keep-production]\n"
            << "  summary [--text]\n";
}

static VersionStatus ParseStatus(const std::string& value) {
  if (value == "active") return VERSION_STATUS_ACTIVE;
  if (value == "deprecated") return VERSION_STATUS_DEPRECATED;
  if (value == "archived") return VERSION_STATUS_ARCHIVED;
  throw std::invalid_argument("unsupported status '" + value + "'; expected active, deprecated or archived");
}

static const std::string& RequireValue(const std::vector<std::string>& args, std::size_t& i) {
  if (i + 1 >= args.size()) {
    throw std::invalid_argument("missing value for " + args[i]);
  }
  return args[++i];
}

static void Print(const google::protobuf::Message& message) {
  std::cout << modelreg::util::ToJson(message) << std::endl;
}

static void PrintSummaryText(const RegistrySummary& summary) {
  const std::string rule(60, '=');
  std::cout << rule << "\n"
            << "MODEL REGISTRY SUMMARY\n"
            << "Generated: " << modelreg::util::ToRfc3339(summary.generated_at()) << "\n"
            << rule << "\n\n"
            << "Total Models: " << summary.total_models() << "\n"
            << "Total Versions: " << summary.total_versions() << "\n\n";

  for (const auto& model : summary.models()) {
    std::cout << model.model_name() << "\n"
              << "   Versions: " << model.version_count() << "\n";
    if (!model.latest_version().empty()) {
      std::cout << "   Latest: v" << model.latest_version() << " (" << modelreg::util::ToRfc3339(model.latest_created_at()).substr(0, 10) << ")\n";
    }
    if (!model.production_version().empty()) {
      std::cout << "   Production: v" << model.production_version() << "\n";
    }
    if (!model.latest_metrics().empty()) {
      std::cout << "   Metrics:";
      bool first = true;
      for (const auto& [name, value] : std::map<std::string, double>(model.latest_metrics().begin(), model.latest_metrics().end())) {
        std::cout << (first ? " " : ", ") << name << "=" << value;
        first = false;
      }
      std::cout << "\n";
    }
    std::cout << "\n";
  }
}

static int Run(modelreg::core::ModelRegistry& registry, const modelreg::runtime::config::RuntimeConfig& config, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "register") {
    if (args.size() < 4) {
      Usage();
      return 1;
    }

    RegisterModelRequest req;
    req.set_model_name(args[1]);
    req.set_model_type(args[2]);
    req.set_bump(BUMP_KIND_PATCH);
    const std::filesystem::path artifact_path = args[3];

    for (std::size_t i = 4; i < args.size(); ++i) {
      const auto& flag = args[i];
      if (flag == "--bump") {
        req.set_bump(modelreg::core::ParseBumpKind(RequireValue(args, i)));
      } else if (flag == "--description") {
        req.set_description(RequireValue(args, i));
      } else if (flag == "--created-by") {
        req.set_created_by(RequireValue(args, i));
      } else if (flag == "--metric") {
        const auto& metric = RequireValue(args, i);
        const auto  eq     = metric.find('=');
        if (eq == std::string::npos || eq == 0) {
          throw std::invalid_argument("metric must be <name>=<value>, got '" + metric + "'");
        }
        (*req.mutable_metrics())[metric.substr(0, eq)] = modelreg::util::ParseDouble(metric.substr(eq + 1), "metric value");
      } else if (flag == "--tag") {
        req.add_tags(RequireValue(args, i));
      } else if (flag == "--data-hash") {
        req.set_training_data_hash(RequireValue(args, i));
      } else if (flag == "--samples") {
        req.set_training_samples(modelreg::util::ParseUnsigned<uint64_t>(RequireValue(args, i), "sample count"));
      } else if (flag == "--features") {
        req.set_feature_count(modelreg::util::ParseUnsigned<uint32_t>(RequireValue(args, i), "feature count"));
      } else if (flag == "--duration") {
        req.set_training_duration_seconds(modelreg::util::ParseDouble(RequireValue(args, i), "duration"));
      } else {
        throw std::invalid_argument("unknown register option " + flag);
      }
    }

    const auto bytes = modelreg::storage::common::ReadFile(artifact_path);
    Print(registry.Register(req, bytes));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "promote" || cmd == "deprecate" || cmd == "archive") {
    if (args.size() != 3) {
      Usage();
      return 1;
    }

    if (cmd == "promote") {
      registry.Promote(args[1], args[2]);
    } else if (cmd == "deprecate") {
      registry.Deprecate(args[1], args[2]);
    } else {
      registry.Archive(args[1], args[2]);
    }
    std::cout << cmd << " " << args[1] << " " << args[2] << ": ok" << std::endl;
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    std::optional<std::string>   model_name;
    std::optional<VersionStatus> status;
    for (std::size_t i = 1; i < args.size(); ++i) {
      if (args[i] == "--status") {
        status = ParseStatus(RequireValue(args, i));
      } else if (!model_name) {
        model_name = args[i];
      } else {
        throw std::invalid_argument("unexpected argument " + args[i]);
      }
    }

    ModelLine out;
    for (auto& record : registry.List(model_name, status)) {
      *out.add_versions() = std::move(record);
    }
    Print(out);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    std::optional<std::string>           version;
    std::optional<std::filesystem::path> output;
    for (std::size_t i = 2; i < args.size(); ++i) {
      if (args[i] == "--output") {
        output = RequireValue(args, i);
      } else if (!version) {
        version = args[i];
      } else {
        throw std::invalid_argument("unexpected argument " + args[i]);
      }
    }

    const auto loaded = registry.Load(args[1], version);
    if (output) {
      modelreg::storage::common::WriteFile(*output, loaded.bytes->data(), loaded.bytes->size(), false);
    }
    Print(loaded.record);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "production") {
    if (args.size() == 2) {
      Print(registry.GetProductionArtifact(args[1]).record);
      return 0;
    }

    const auto production = registry.GetProductionModels();
    ModelLine  out;
    for (const auto& loaded : production.models) {
      *out.add_versions() = loaded.record;
    }
    Print(out);
    for (const auto& failure : production.failures) {
      std::cerr << "failed to load " << failure.model_name << " v" << failure.version << ": " << failure.error << "\n";
    }
    return production.failures.empty() ? 0 : static_cast<int>(modelreg::util::ExitCode::kArtifactFailure);
  }

  // ------------------------------------------------------------

  if (cmd == "lineage") {
    if (args.size() == 2) {
      Print(registry.ExportLineage(args[1]));
      return 0;
    }
    if (args.size() == 3) {
      const auto report = registry.ExportLineageToFile(args[1], args[2]);
      std::cout << "lineage for " << args[1] << " (" << report.total_versions() << " versions) written to " << args[2] << std::endl;
      return 0;
    }
    Usage();
    return 1;
  }

  // ------------------------------------------------------------

  if (cmd == "compare") {
    if (args.size() != 4) {
      Usage();
      return 1;
    }
    Print(registry.CompareVersions(args[1], args[2], args[3]));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup") {
    if (args.size() < 2) {
      Usage();
      return 1;
    }

    uint32_t keep_last_n     = config.retention().keep_last_n();
    bool     keep_production = !config.retention().has_keep_production() || config.retention().keep_production();
    bool     keep_given      = false;
    for (std::size_t i = 2; i < args.size(); ++i) {
      if (args[i] == "--no-keep-production") {
        keep_production = false;
      } else if (!keep_given) {
        keep_last_n = modelreg::util::ParseUnsigned<uint32_t>(args[i], "keep_last_n");
        keep_given  = true;
      } else {
        throw std::invalid_argument("unexpected argument " + args[i]);
      }
    }

    const auto report = registry.Cleanup(args[1], keep_last_n, keep_production);
    Print(report);
    return report.failures().empty() ? 0 : static_cast<int>(modelreg::util::ExitCode::kArtifactFailure);
  }

  // ------------------------------------------------------------

  if (cmd == "summary") {
    const auto summary = registry.Summary();
    if (args.size() == 2 && args[1] == "--text") {
      PrintSummaryText(summary);
    } else if (args.size() == 1) {
      Print(summary);
    } else {
      Usage();
      return 1;
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty() || args[0] == "--help" || args[0] == "-h") {
    Usage();
    return args.empty() ? 1 : 0;
  }

  int rc = 0;
  try {
    auto config = config_path.empty() ? modelreg::config::ConfigLoader::Defaults() : modelreg::config::ConfigLoader::LoadFromYaml(config_path);

    modelreg::observability::InitializeTracing(config);
    modelreg::observability::InitializeMetrics(config);
    modelreg::observability::InitializeLogging(config);

    auto app = modelreg::factory::Build(config);
    rc       = Run(*app.registry, config, args);
  } catch (const std::exception& e) {
    std::cerr << modelreg::util::ErrorName(e) << ": " << e.what() << std::endl;
    rc = static_cast<int>(modelreg::util::ToExitCode(e));
  }

  modelreg::observability::ShutdownLogging();
  modelreg::observability::ShutdownMetrics();
  modelreg::observability::ShutdownTracing();
  return rc;
}
