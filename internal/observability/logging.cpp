#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace ctxsync::observability {
namespace {

using ctxsync::runtime::config::LoggingConfig;

// Environment beats config beats the built-in default.
std::string Resolve(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool ResolveTraceContextEnabled(const LoggingConfig& config) {
  if (const char* value = std::getenv("CTXSYNC_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string_view(value) == "1" || std::string_view(value) == "true";
  }
  return config.include_trace_context();
}

std::vector<spdlog::sink_ptr> BuildSinks(const LoggingConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  const auto file = Resolve("CTXSYNC_LOG_FILE", config.file(), "");
  if (!file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
  }
  return sinks;
}

bool g_include_trace_context{false};

// Values containing spaces or quotes are quoted so lines stay parseable as key=value.
std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    if (field.value.find_first_of(" \t\"=") == std::string::npos) {
      out << field.value;
      continue;
    }
    out << '"';
    for (const char c : field.value) {
      if (c == '"' || c == '\\') {
        out << '\\';
      }
      out << c;
    }
    out << '"';
  }
  return out.str();
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return {};
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  auto trace_id = context.trace_id();
  auto span_id  = context.span_id();
  if (trace_id.IsValid() && span_id.IsValid()) {
    uint8_t trace_bytes[16];
    uint8_t span_bytes[8];
    trace_id.CopyBytesTo(trace_bytes);
    span_id.CopyBytesTo(span_bytes);
    return "trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
  }
  return {};
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField ContextField(std::string_view context_id) {
  return StringField("context_id", context_id);
}

LogField ErrorField(std::string_view what) {
  return StringField("error", what);
}

void InitializeLogging(const ctxsync::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  auto        sinks   = BuildSinks(logging);

  spdlog::drop("ctxsync");
  auto logger = std::make_shared<spdlog::logger>("ctxsync", sinks.begin(), sinks.end());
  logger->set_pattern(Resolve("CTXSYNC_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"));
  logger->set_level(spdlog::level::from_str(Resolve("CTXSYNC_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = ResolveTraceContextEnabled(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& part : {SerializeFields(fields), TraceContextFields()}) {
    if (!part.empty()) {
      line += ' ';
      line += part;
    }
  }
  spdlog::log(level, "{}", line);
}

} // namespace ctxsync::observability
