#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace labfleet::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Short runs end before the first periodic export; keep the interval small.
constexpr std::uint32_t kDefaultExportIntervalMs = 1000;

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Emit(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, std::initializer_list<AttributePair> attributes) {
  if (!instrument) return;
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else if constexpr (requires { instrument->Add(value, attributes); }) {
    instrument->Add(value, attributes);
  } else {
    instrument->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> node_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      command_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      workflow_duration_ms;
};

bool InitializeMetrics(const labfleet::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpHttpMetricExporterOptions exporter_options;
  exporter_options.url = OtlpSignalUrl(observability.otlp_endpoint(), "METRICS");
  auto exporter        = otlp::OtlpHttpMetricExporterFactory::Create(exporter_options);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(interval / 2);

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
  g_provider  = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create({{"service.name", "labfleet"}}));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  // final export carries the outcomes of this run
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("labfleet.fleet", "0.1.0");

  impl_->node_outcomes        = impl_->meter->CreateUInt64Counter("labfleet.node.outcomes", "1", "Node workflow outcomes by status");
  impl_->command_latency_ms   = impl_->meter->CreateDoubleHistogram("labfleet.console.command_ms", "ms", "Console command round trip");
  impl_->workflow_duration_ms = impl_->meter->CreateDoubleHistogram("labfleet.node.workflow_ms", "ms", "Per-node workflow duration");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordNodeOutcome(std::string_view kind, std::string_view status) {
  Emit(impl_->node_outcomes, static_cast<std::uint64_t>(1), {{"kind", std::string(kind)}, {"status", std::string(status)}});
}

void Metrics::ObserveCommandLatencyMs(std::string_view step, double latency_ms) {
  Emit(impl_->command_latency_ms, latency_ms, {{"step", std::string(step)}});
}

void Metrics::ObserveNodeWorkflowMs(std::string_view kind, double duration_ms) {
  Emit(impl_->workflow_duration_ms, duration_ms, {{"kind", std::string(kind)}});
}

} // namespace labfleet::observability

#endif
