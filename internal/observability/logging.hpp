#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ctxsync::runtime::config {
class RuntimeConfig;
}

namespace ctxsync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

// context_id=<id>
LogField ContextField(std::string_view context_id);
// error=<what>
LogField ErrorField(std::string_view what);

// Safe to call more than once; later calls reconfigure the existing logger.
void InitializeLogging(const ctxsync::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Emits "<message> k=v ..." on the "ctxsync" logger, followed by trace_id and
// span_id when trace context logging is on and a span is active.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace ctxsync::observability

#define CTXSYNC_LOG_DEBUG(message, ...) ::ctxsync::observability::LogDebug((message), ##__VA_ARGS__)
#define CTXSYNC_LOG_INFO(message, ...) ::ctxsync::observability::LogInfo((message), ##__VA_ARGS__)
#define CTXSYNC_LOG_WARN(message, ...) ::ctxsync::observability::LogWarn((message), ##__VA_ARGS__)
#define CTXSYNC_LOG_ERROR(message, ...) ::ctxsync::observability::LogError((message), ##__VA_ARGS__)
