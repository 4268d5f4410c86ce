#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ctxsync::runtime::config {
class RuntimeConfig;
}

namespace ctxsync::observability {

// Both return false when the signal is disabled in config or the build has no
// OpenTelemetry support.
bool InitializeTracing(const ctxsync::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ctxsync::runtime::config::RuntimeConfig& config);
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
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
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

  // Caller-facing ContextManager operations.
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Cache tiers: one lookup per probed tier, errors for degraded L2/L3.
  void RecordCacheLookup(std::string_view tier, bool hit);
  void RecordCacheError(std::string_view tier);
  void SetTierEntries(std::string_view tier, std::uint64_t entries);

  // Sync passes.
  void RecordSyncPass(std::string_view outcome);
  void ObserveSyncLatencyMs(double latency_ms);
  void RecordSyncConflicts(std::uint64_t conflicts);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const ctxsync::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const ctxsync::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordCacheLookup(std::string_view, bool) {
}

inline void Metrics::RecordCacheError(std::string_view) {
}

inline void Metrics::SetTierEntries(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordSyncPass(std::string_view) {
}

inline void Metrics::ObserveSyncLatencyMs(double) {
}

inline void Metrics::RecordSyncConflicts(std::uint64_t) {
}
#endif

} // namespace ctxsync::observability
