#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace modelreg::observability {
namespace {

constexpr const char* kLoggerName     = "model-registry";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment wins over the config file; empty values fall through.
std::string FirstSet(const char* env_name, const std::string& configured, const char* fallback) {
  const char* env = std::getenv(env_name);
  if (env != nullptr && *env != '\0') {
    return env;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off, which would silence everything.
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \"=") == std::string::npos) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
}

void AppendField(std::string& out, std::string_view key, const std::string& value) {
  out += ' ';
  out += key;
  out += '=';
  AppendValue(out, value);
}

#ifdef ENABLE_OTEL
template <typename Id>
std::string ToHex(const Id& id) {
  char buffer[2 * Id::kSize];
  id.ToLowerBase16(opentelemetry::nostd::span<char, 2 * Id::kSize>(buffer, sizeof(buffer)));
  return std::string(buffer, sizeof(buffer));
}

void AppendTraceContext(std::string& out) {
  auto context = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent())->GetContext();
  if (!context.IsValid()) {
    return;
  }
  AppendField(out, "trace_id", ToHex(context.trace_id()));
  AppendField(out, "span_id", ToHex(context.span_id()));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

// stderr only; stdout belongs to CLI output.
void InitializeLogging(const modelreg::runtime::config::RuntimeConfig& config) {
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(FirstSet("MODELREG_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(ParseLevel(FirstSet("MODELREG_LOG_LEVEL", config.logging().level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field.key, field.value);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace modelreg::observability
