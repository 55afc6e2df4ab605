#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace circulate::runtime::config {
class RuntimeConfig;
}

namespace circulate::observability {

/*
  Tracing and metrics export over OTLP. Without ENABLE_OTEL every call below
  compiles to nothing, so callers never guard their instrumentation.
*/
bool InitializeTracing(const circulate::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const circulate::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

struct TraceIds {
  std::string trace_id;
  std::string span_id;
};

// Hex ids of the span active on this thread.
std::optional<TraceIds> ActiveTraceIds();

// A span that is current for its lifetime.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // Marks the span failed.
  void RecordError(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordLockAcquire(std::string_view lock_type, std::string_view result);
  void RecordTaskOutcome(std::string_view task, std::string_view outcome);
  void RecordTaskRetry(std::string_view task);
  void ObserveTaskDurationMs(std::string_view task, double duration_ms);
  void RecordPartUploaded(std::uint64_t bytes);
  void RecordUploadAborted();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const circulate::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const circulate::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline std::optional<TraceIds> ActiveTraceIds() {
  return std::nullopt;
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordError(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordLockAcquire(std::string_view, std::string_view) {
}

inline void Metrics::RecordTaskOutcome(std::string_view, std::string_view) {
}

inline void Metrics::RecordTaskRetry(std::string_view) {
}

inline void Metrics::ObserveTaskDurationMs(std::string_view, double) {
}

inline void Metrics::RecordPartUploaded(std::uint64_t) {
}

inline void Metrics::RecordUploadAborted() {
}
#endif

} // namespace circulate::observability
