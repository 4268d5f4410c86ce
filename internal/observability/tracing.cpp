#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace ctxsync::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace nostd     = opentelemetry::nostd;

using ctxsync::runtime::config::ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE;

namespace {

std::mutex                                g_tracing_mutex;
std::shared_ptr<sdktrace::TracerProvider> g_sdk_provider;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const otlp_export::Settings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Resolved per span so spans opened before InitializeTracing fall back to the
// global no-op provider.
nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer(std::string(otlp_export::kInstrumentationScope),
                                                             std::string(otlp_export::kInstrumentationVersion));
}

} // namespace

bool InitializeTracing(const ctxsync::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings = otlp_export::ResolveSettings(observability, otlp_export::Signal::kTraces);
  auto       exporter = MakeExporter(settings);

  std::unique_ptr<sdktrace::SpanProcessor> processor;
  if (observability.tracing().processor() == ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE) {
    processor = sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  } else {
    processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  }

  std::shared_ptr<sdktrace::TracerProvider> provider(
      sdktrace::TracerProviderFactory::Create(std::move(processor), otlp_export::BuildResource(settings)));

  std::lock_guard lock(g_tracing_mutex);
  g_sdk_provider = provider;
  trace_api::Provider::SetTracerProvider(nostd::shared_ptr<trace_api::TracerProvider>(provider));
  return true;
}

void ShutdownTracing() {
  std::lock_guard lock(g_tracing_mutex);
  if (!g_sdk_provider) {
    return;
  }
  g_sdk_provider->ForceFlush();
  g_sdk_provider->Shutdown();
  g_sdk_provider.reset();
  trace_api::Provider::SetTracerProvider(nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
}

struct SpanScope::Impl {
  nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>  scope;

  bool Live() const { return static_cast<bool>(span); }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }
  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(trace_api::Tracer::WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_ || !impl_->Live()) {
    return;
  }
  impl_->scope.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->Live()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->Live()) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_ || !impl_->Live()) {
    return;
  }
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace ctxsync::observability

#endif
