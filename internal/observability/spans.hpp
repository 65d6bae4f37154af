#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace labfleet::runtime::config {
class RuntimeConfig;
}

namespace labfleet::observability {

/*
  Both signals export over OTLP/HTTP. The collector URL comes from
  observability.otlp_endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  then OTEL_EXPORTER_OTLP_ENDPOINT, then localhost:4318.
*/
bool InitializeTracing(const labfleet::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const labfleet::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

#ifdef ENABLE_OTEL
// "<base>/v1/<signal>" for signal TRACES or METRICS.
std::string OtlpSignalUrl(const std::string& configured, const std::string& signal);
#endif

/*
  RAII span around a provisioning run or a single node workflow.
*/
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // kind: "provision" | "script"; status: report status name
  void RecordNodeOutcome(std::string_view kind, std::string_view status);
  void ObserveCommandLatencyMs(std::string_view step, double latency_ms);
  void ObserveNodeWorkflowMs(std::string_view kind, double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const labfleet::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const labfleet::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordNodeOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveCommandLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveNodeWorkflowMs(std::string_view, double) {
}
#endif

} // namespace labfleet::observability
