#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace modelreg::observability {

inline constexpr const char* kInstrumentationName    = "model-registry";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

struct OtlpTarget {
  std::string endpoint;
  bool        http = false;
};

/*
  Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
  `signal` is "traces" or "metrics".
*/
OtlpTarget ResolveOtlpTarget(const modelreg::runtime::config::ObservabilityConfig& config, std::string_view signal);

opentelemetry::sdk::resource::Resource BuildResource();

} // namespace modelreg::observability

#endif
