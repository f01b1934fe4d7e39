#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace modelreg::observability {

OtlpTarget ResolveOtlpTarget(const modelreg::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  OtlpTarget target;
  target.http = config.transport() == modelreg::runtime::config::OTLP_TRANSPORT_HTTP;

  std::string signal_env(signal);
  std::transform(signal_env.begin(), signal_env.end(), signal_env.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  signal_env = "OTEL_EXPORTER_OTLP_" + signal_env + "_ENDPOINT";

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env.c_str())) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else if (target.http) {
    target.endpoint = "http://localhost:4318/v1/" + std::string(signal);
  } else {
    target.endpoint = "localhost:4317";
  }
  return target;
}

opentelemetry::sdk::resource::Resource BuildResource() {
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", kInstrumentationName},
                                                                  {"service.version", kInstrumentationVersion}};
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace modelreg::observability

#endif
