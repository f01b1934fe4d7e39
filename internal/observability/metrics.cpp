#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#if __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#else
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#endif

#include <chrono>
#include <map>
#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace modelreg::observability {

namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

constexpr uint32_t kDefaultExportIntervalMs = 1000;

std::mutex                                 g_metrics_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_meter_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildMetricExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// SDK releases disagree on whether readers are passed as unique or shared.
template <typename Provider>
void AttachReader(Provider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

} // namespace

bool InitializeMetrics(const modelreg::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs);

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildMetricExporter(ResolveOtlpTarget(observability, "metrics")),
                                                                          reader_options);
  auto provider =
      std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), BuildResource());
  AttachReader(*provider, std::move(reader));

  std::lock_guard<std::mutex> lock(g_metrics_mutex);
  g_meter_provider = std::move(provider);
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_meter_provider));
  return true;
}

void ShutdownMetrics() {
  std::lock_guard<std::mutex> lock(g_metrics_mutex);
  if (!g_meter_provider) {
    return;
  }
  g_meter_provider->ForceFlush();
  g_meter_provider->Shutdown();
  g_meter_provider.reset();
}

/*
  Instruments bind to whichever meter provider is installed on first use, so
  InitializeMetrics must run before the first registry operation.
*/
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<uint64_t>> operations;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>> latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<uint64_t>> versions_removed;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->operations       = meter->CreateUInt64Counter("modelreg.operations", "Registry operations by name and outcome", "1");
  impl_->latency_ms       = meter->CreateDoubleHistogram("modelreg.operation.duration", "Registry operation latency", "ms");
  impl_->versions_removed = meter->CreateUInt64Counter("modelreg.cleanup.removed_versions", "Versions removed by cleanup", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, bool success) {
  const std::map<std::string, std::string> attributes = {{"operation", std::string(operation)}, {"outcome", success ? "ok" : "error"}};
  impl_->operations->Add(1, attributes);
}

void Metrics::ObserveOperationLatencyMs(std::string_view operation, double latency_ms) {
  const std::map<std::string, std::string> attributes = {{"operation", std::string(operation)}};
  impl_->latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordArtifactsRemoved(std::string_view model_name, std::uint64_t count) {
  if (count == 0) {
    return;
  }
  const std::map<std::string, std::string> attributes = {{"model", std::string(model_name)}};
  impl_->versions_removed->Add(count, attributes);
}

} // namespace modelreg::observability

#endif
