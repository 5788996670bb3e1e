#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace fleet::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

using fleet::runtime::config::RuntimeConfig;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
// Per-fleet attributes multiply series by fleet count.
std::atomic<bool> g_fleet_labels{true};

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const detail::OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::string FleetLabel(std::string_view fleet) {
  return g_fleet_labels.load() ? std::string(fleet) : std::string("all");
}

} // namespace

bool InitializeMetrics(const RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto&                                      settings = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(settings.collection_interval_ms() > 0 ? settings.collection_interval_ms() : 15'000);
  if (settings.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(settings.export_timeout_ms());
  }
  g_fleet_labels = settings.fleet_labels_enabled();

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(detail::ResolveOtlpTarget(config, "metrics")),
                                                                         reader_options);

  const resource::ResourceAttributes attrs = {{"service.name", "fleet-autoscaler"}, {"service.namespace", "runner-fleet"}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// ------------------------------------------------------------
// Instruments
// ------------------------------------------------------------

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> scaling_decisions;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      lifecycle_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   tracked_workers;

  std::mutex                          workers_mutex;
  std::map<std::string, std::int64_t> workers_by_fleet;

  static void ObserveTrackedWorkers(metrics_api::ObserverResult result, void* state) {
    auto*           impl = static_cast<Impl*>(state);
    std::lock_guard lock(impl->workers_mutex);
    auto observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
    for (const auto& [fleet, count] : impl->workers_by_fleet) {
      const std::initializer_list<AttributePair> attributes = {{"fleet", opentelemetry::nostd::string_view(fleet)}};
      observer->Observe(count, attributes);
    }
  }
};

// Instruments bind to whichever provider is global when first used, so
// InitializeMetrics must run before any fleet is enabled.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("runner-fleet", "0.1.0");

  impl_->requests           = impl_->meter->CreateUInt64Counter("fleet.admin.requests", "Admin RPCs by route and outcome", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("fleet.admin.latency", "Admin RPC latency", "ms");
  impl_->scaling_decisions  = impl_->meter->CreateUInt64Counter("fleet.scaling.decisions", "Scaling decisions by action", "1");
  impl_->lifecycle_duration_ms =
      impl_->meter->CreateDoubleHistogram("fleet.worker.operation.duration", "Provision, destroy and rotate duration", "ms");
  impl_->tracked_workers = impl_->meter->CreateInt64ObservableGauge("fleet.workers.tracked", "Workers tracked per fleet", "1");
  impl_->tracked_workers->AddCallback(&Impl::ObserveTrackedWorkers, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string                          route_value(route);
  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route_value)}, {"success", success}};
  impl_->requests->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::string                          route_value(route);
  const std::initializer_list<AttributePair> attributes = {{"route", opentelemetry::nostd::string_view(route_value)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordScalingDecision(std::string_view fleet, std::string_view action) {
  const std::string                          fleet_value = FleetLabel(fleet);
  const std::string                          action_value(action);
  const std::initializer_list<AttributePair> attributes = {{"fleet", opentelemetry::nostd::string_view(fleet_value)},
                                                           {"action", opentelemetry::nostd::string_view(action_value)}};
  impl_->scaling_decisions->Add(1, attributes);
}

void Metrics::ObserveLifecycleDurationMs(std::string_view op, std::string_view outcome, double duration_ms) {
  const std::string                          op_value(op);
  const std::string                          outcome_value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"op", opentelemetry::nostd::string_view(op_value)},
                                                           {"outcome", opentelemetry::nostd::string_view(outcome_value)}};
  impl_->lifecycle_duration_ms->Record(duration_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::SetTrackedWorkers(std::string_view fleet, std::int64_t count) {
  std::lock_guard lock(impl_->workers_mutex);
  if (count == 0) {
    impl_->workers_by_fleet.erase(std::string(fleet));
    return;
  }
  impl_->workers_by_fleet[std::string(fleet)] = count;
}

} // namespace fleet::observability

#endif
