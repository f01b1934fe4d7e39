#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace modelreg::observability {

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::mutex                                g_tracing_mutex;
std::shared_ptr<sdktrace::TracerProvider> g_tracer_provider;

std::unique_ptr<sdktrace::SpanExporter> BuildSpanExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);
}

} // namespace

bool InitializeTracing(const modelreg::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  const auto target    = ResolveOtlpTarget(config.observability(), "traces");
  auto       processor = sdktrace::BatchSpanProcessorFactory::Create(BuildSpanExporter(target), sdktrace::BatchSpanProcessorOptions{});

  std::lock_guard<std::mutex> lock(g_tracing_mutex);
  g_tracer_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), BuildResource()));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracer_provider));
  return true;
}

void ShutdownTracing() {
  std::lock_guard<std::mutex> lock(g_tracing_mutex);
  if (!g_tracer_provider) {
    return;
  }
  g_tracer_provider->ForceFlush();
  g_tracer_provider->Shutdown();
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
  g_tracer_provider.reset();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> started) : span(started), scope(started) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  auto span = CurrentTracer()->StartSpan(std::string(name));
  span->SetAttribute("component", kInstrumentationName);
  impl_ = std::make_unique<Impl>(std::move(span));
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) {
    return;
  }
  const std::string message(description);
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace modelreg::observability

#endif
