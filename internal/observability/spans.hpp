#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

/*
  Tracing and metrics export over OTLP.

  Compiled out unless ENABLE_OTEL is defined; the fallbacks below keep every
  call site unconditional. Spans cover controller ticks, worker lifecycle
  operations and admin RPCs. Metrics are labelled by fleet unless
  observability.metrics.fleet_labels_enabled is off.
*/

bool InitializeTracing(const fleet::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  // Marks the span failed; description is sanitized before export.
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

  // Admin surface
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Fleet loops
  void RecordScalingDecision(std::string_view fleet, std::string_view action);
  void ObserveLifecycleDurationMs(std::string_view op, std::string_view outcome, double duration_ms);
  void SetTrackedWorkers(std::string_view fleet, std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifdef ENABLE_OTEL
namespace detail {

// Where one OTLP signal ("traces" or "metrics") is exported.
struct OtlpTarget {
  std::string endpoint;
  bool        http = false;
};

OtlpTarget ResolveOtlpTarget(const fleet::runtime::config::RuntimeConfig& config, std::string_view signal);

} // namespace detail
#else
inline bool InitializeTracing(const fleet::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const fleet::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordScalingDecision(std::string_view, std::string_view) {
}

inline void Metrics::ObserveLifecycleDurationMs(std::string_view, std::string_view, double) {
}

inline void Metrics::SetTrackedWorkers(std::string_view, std::int64_t) {
}
#endif

} // namespace fleet::observability
