#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace modelreg::runtime::config {
class RuntimeConfig;
}

namespace modelreg::observability {

/*
  OpenTelemetry wiring. Exporters are configured from
  RuntimeConfig.observability; without ENABLE_OTEL every call below is an
  inline no-op.
*/
bool InitializeTracing(const modelreg::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const modelreg::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// One span per registry operation, active for the scope's lifetime.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// Process-wide instruments: operation count/latency and cleanup removals.
class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view operation, bool success);
  void ObserveOperationLatencyMs(std::string_view operation, double latency_ms);
  void RecordArtifactsRemoved(std::string_view model_name, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const modelreg::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const modelreg::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordArtifactsRemoved(std::string_view, std::uint64_t) {
}
#endif

} // namespace modelreg::observability
