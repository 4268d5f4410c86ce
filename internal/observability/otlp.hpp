#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace ctxsync::observability::otlp_export {

enum class Signal {
  kTraces,
  kMetrics,
};

// Exporter settings shared by the trace and metric pipelines.
struct Settings {
  std::string endpoint;
  bool        http{false};
  bool        insecure{true};
  std::string service_name;
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
Settings ResolveSettings(const ctxsync::runtime::config::ObservabilityConfig& config, Signal signal);

opentelemetry::sdk::resource::Resource BuildResource(const Settings& settings);

inline constexpr std::string_view kInstrumentationScope   = "ctxsync";
inline constexpr std::string_view kInstrumentationVersion = "0.1.0";

} // namespace ctxsync::observability::otlp_export

#endif
