#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace labfleet::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

} // namespace

std::string OtlpSignalUrl(const std::string& configured, const std::string& signal) {
  std::string base = configured;
  if (base.empty()) {
    const std::string specific = "OTEL_EXPORTER_OTLP_" + signal + "_ENDPOINT";
    if (const char* url = std::getenv(specific.c_str())) return url;
    if (const char* url = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) base = url;
  }
  if (base.empty()) base = "http://localhost:4318";

  while (!base.empty() && base.back() == '/') base.pop_back();

  std::string path = "/v1/";
  for (char c : signal) path.push_back(static_cast<char>(c - 'A' + 'a'));
  return base + path;
}

bool InitializeTracing(const labfleet::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  otlp::OtlpHttpExporterOptions options;
  options.url   = OtlpSignalUrl(observability.otlp_endpoint(), "TRACES");
  auto exporter = otlp::OtlpHttpExporterFactory::Create(options);

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create({{"service.name", "labfleet"}}));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer("labfleet.fleet", "0.1.0");
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  // spans of abandoned node workers may still be open; flush what has ended
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) return;

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (!impl_ || !impl_->span) return;
  impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (!impl_ || !impl_->span) return;
  impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (!impl_ || !impl_->span) return;
  impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->span) return;
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace labfleet::observability

#endif
