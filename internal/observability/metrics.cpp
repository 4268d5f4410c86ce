#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define CTXSYNC_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define CTXSYNC_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace ctxsync::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool cache_metrics_enabled{true};
  bool sync_metrics_enabled{true};
  bool tier_labels_enabled{true};
};

MetricsOptions g_metrics_options;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const otlp_export::Settings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_errors;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> sync_passes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> sync_conflicts;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      sync_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   tier_entries_gauge;

  std::mutex                                    tier_entries_mutex;
  std::unordered_map<std::string, std::int64_t> tier_entries_values;
};

bool InitializeMetrics(const ctxsync::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto  settings      = otlp_export::ResolveSettings(observability, otlp_export::Signal::kMetrics);
  const auto& metric_config = observability.metrics();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000);
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

#ifdef CTXSYNC_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(settings), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeMetricExporter(settings), reader_options);
#endif

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           otlp_export::BuildResource(settings));
  AddMetricReaderCompat(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.cache_metrics_enabled = metric_config.cache_metrics_enabled();
  g_metrics_options.sync_metrics_enabled  = metric_config.sync_metrics_enabled();
  g_metrics_options.tier_labels_enabled   = metric_config.tier_labels_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter(std::string(otlp_export::kInstrumentationScope), std::string(otlp_export::kInstrumentationVersion));

  impl_->request_count      = impl_->meter->CreateUInt64Counter("ctxsync.request.count", "1", "Context manager calls");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("ctxsync.request.latency_ms", "ms", "Context manager call latency");
  impl_->cache_lookups      = impl_->meter->CreateUInt64Counter("ctxsync.cache.lookups", "1", "Cache lookups per tier and outcome");
  impl_->cache_errors       = impl_->meter->CreateUInt64Counter("ctxsync.cache.errors", "1", "Cache tier failures degraded to misses");
  impl_->sync_passes        = impl_->meter->CreateUInt64Counter("ctxsync.sync.passes", "1", "Sync passes by outcome");
  impl_->sync_conflicts     = impl_->meter->CreateUInt64Counter("ctxsync.sync.conflicts", "1", "Fields resolved by the conflict resolver");
  impl_->sync_latency_ms    = impl_->meter->CreateDoubleHistogram("ctxsync.sync.latency_ms", "ms", "Sync pass latency in milliseconds");
  impl_->tier_entries_gauge = impl_->meter->CreateInt64ObservableGauge("ctxsync.cache.tier_entries", "Entries held per cache tier", "1");
  impl_->tier_entries_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->tier_entries_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [tier, entries] : impl->tier_entries_values) {
          if (g_metrics_options.tier_labels_enabled) {
            const std::initializer_list<AttributePair> attributes = {{"tier", tier}};
            int_result->Observe(entries, attributes);
          } else {
            int_result->Observe(entries);
          }
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordCacheLookup(std::string_view tier, bool hit) {
  if (!impl_ || !impl_->cache_lookups || !g_metrics_options.cache_metrics_enabled) {
    return;
  }

  if (g_metrics_options.tier_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"tier", std::string(tier)}, {"hit", hit}};
    AddWithAttributes(impl_->cache_lookups, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"hit", hit}};
  AddWithAttributes(impl_->cache_lookups, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordCacheError(std::string_view tier) {
  if (!impl_ || !impl_->cache_errors || !g_metrics_options.cache_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"tier", std::string(tier)}};
  AddWithAttributes(impl_->cache_errors, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetTierEntries(std::string_view tier, std::uint64_t entries) {
  if (!impl_ || !impl_->tier_entries_gauge || !g_metrics_options.cache_metrics_enabled) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->tier_entries_mutex);
  impl_->tier_entries_values[std::string(tier)] = static_cast<std::int64_t>(entries);
}

void Metrics::RecordSyncPass(std::string_view outcome) {
  if (!impl_ || !impl_->sync_passes || !g_metrics_options.sync_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->sync_passes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveSyncLatencyMs(double latency_ms) {
  if (!impl_ || !impl_->sync_latency_ms || !g_metrics_options.sync_metrics_enabled) {
    return;
  }

  RecordWithAttributes(impl_->sync_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordSyncConflicts(std::uint64_t conflicts) {
  if (!impl_ || !impl_->sync_conflicts || !g_metrics_options.sync_metrics_enabled || conflicts == 0) {
    return;
  }

  AddWithAttributes(impl_->sync_conflicts, conflicts, std::initializer_list<AttributePair>{});
}

} // namespace ctxsync::observability

#endif
