#include "otlp.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>
#include <unistd.h>

namespace ctxsync::observability::otlp_export {

namespace resource = opentelemetry::sdk::resource;

namespace {

const char* SignalEnv(Signal signal) {
  return signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultEndpoint(Signal signal, bool http) {
  if (!http) {
    return "localhost:4317";
  }
  return signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

std::string HostName() {
  char buffer[256] = {};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "unknown";
  }
  return buffer;
}

} // namespace

Settings ResolveSettings(const ctxsync::runtime::config::ObservabilityConfig& config, Signal signal) {
  Settings settings;
  settings.http         = config.transport() == ctxsync::runtime::config::OTLP_TRANSPORT_HTTP;
  settings.service_name = config.service_name().empty() ? "ctxsyncd" : config.service_name();

  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
  } else if (const char* env = std::getenv(SignalEnv(signal))) {
    settings.endpoint = env;
  } else if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = env;
  } else {
    settings.endpoint = DefaultEndpoint(signal, settings.http);
  }
  return settings;
}

resource::Resource BuildResource(const Settings& settings) {
  resource::ResourceAttributes attrs = {
      {"service.name", settings.service_name},
      {"service.namespace", std::string(kInstrumentationScope)},
      {"service.version", std::string(kInstrumentationVersion)},
      {"host.name", HostName()},
  };
  return resource::Resource::Create(attrs);
}

} // namespace ctxsync::observability::otlp_export

#endif
