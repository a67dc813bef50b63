#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace docflow::runtime::config {
class RuntimeConfig;
}

namespace docflow::observability {

/*
  Tracing and metrics for workflow requests and lock waits.

  Without DOCFLOW_ENABLE_OTEL every call below is an inline no-op, so
  call sites never need their own #ifdef.
*/

bool InitializeTracing(const docflow::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const docflow::runtime::config::RuntimeConfig& config);
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef DOCFLOW_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // entity is the lock key prefix ("quotation", "invoice")
  void ObserveLockWaitMs(std::string_view entity, double wait_ms, bool acquired);

 private:
  Metrics();
#ifdef DOCFLOW_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef DOCFLOW_ENABLE_OTEL
inline bool InitializeTracing(const docflow::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const docflow::runtime::config::RuntimeConfig&) {
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

inline void Metrics::ObserveLockWaitMs(std::string_view, double, bool) {
}
#endif

} // namespace docflow::observability
