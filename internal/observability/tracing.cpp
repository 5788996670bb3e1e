#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/sanitize.hpp"

namespace fleet::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using fleet::runtime::config::ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE;
using fleet::runtime::config::OTLP_TRANSPORT_HTTP;
using fleet::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kInstrumentationName    = "runner-fleet";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

const char* EnvOrNull(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  return value && *value ? value : nullptr;
}

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const detail::OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  std::lock_guard lock(g_mutex);
  if (!g_tracer) {
    // global provider is a no-op until InitializeTracing installs ours
    g_tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);
  }
  return g_tracer;
}

} // namespace

namespace detail {

OtlpTarget ResolveOtlpTarget(const RuntimeConfig& config, std::string_view signal) {
  const auto& observability = config.observability();

  OtlpTarget target;
  target.http = observability.transport() == OTLP_TRANSPORT_HTTP;

  std::string upper(signal);
  for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  if (!observability.otlp_endpoint().empty()) {
    target.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = EnvOrNull("OTEL_EXPORTER_OTLP_" + upper + "_ENDPOINT")) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = EnvOrNull("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else {
    target.endpoint = target.http ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
  }
  return target;
}

} // namespace detail

bool InitializeTracing(const RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  auto exporter = BuildExporter(detail::ResolveOtlpTarget(config, "traces"));

  std::unique_ptr<sdktrace::SpanProcessor> processor;
  if (observability.tracing().processor() == ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE) {
    processor = sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  } else {
    processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  }

  const resource::ResourceAttributes attrs = {{"service.name", "fleet-autoscaler"}, {"service.namespace", "runner-fleet"}};

  std::lock_guard lock(g_mutex);
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::lock_guard lock(g_mutex);
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

// ------------------------------------------------------------
// SpanScope
// ------------------------------------------------------------

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = Tracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(opentelemetry::nostd::string_view(key.data(), key.size()),
                              opentelemetry::nostd::string_view(value.data(), value.size()));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->span) return;

  const auto clean = util::SanitizeSecrets(description);
  const std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>> attributes = {
      {"exception.message", opentelemetry::nostd::string_view(clean)}};
  impl_->span->AddEvent("exception", attributes);
  impl_->span->SetStatus(trace_api::StatusCode::kError, clean);
}

} // namespace fleet::observability

#endif
