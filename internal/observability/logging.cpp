#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace labfleet::observability {
namespace {

using labfleet::runtime::config::RuntimeConfig;

// pool threads log concurrently, the thread id tells node workers apart
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [t%t] %v";

std::string EnvOr(const char* name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(name)) return value;
  return configured.empty() ? fallback : configured;
}

// Console output is captured into fields verbatim; keep every record on one line.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\r\n\"=") == std::string::npos) {
    out += value;
    return;
  }

  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendTraceId(std::string& out) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  char hex[32];
  context.trace_id().ToLowerBase16(hex);
  out += " trace_id=";
  out.append(hex, sizeof(hex));
}
#else
void AppendTraceId(std::string&) {
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

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const RuntimeConfig& config) {
  spdlog::drop("labfleet");
  auto logger = spdlog::stderr_color_mt("labfleet");
  logger->set_pattern(EnvOr("LABFLEET_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("LABFLEET_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  AppendTraceId(line);

  spdlog::log(level, "{}", line);
}

} // namespace labfleet::observability
