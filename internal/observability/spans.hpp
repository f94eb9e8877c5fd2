#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace aiknowsys::runtime::config {
class RuntimeConfig;
}

namespace aiknowsys::observability {

/*
  Optional OpenTelemetry tracing for CLI commands.

  Tracing is compiled in only with ENABLE_OTEL; otherwise every function
  here is an empty inline and SpanScope carries no state. Returns true
  when an exporter was installed.
*/
bool InitializeTracing(const aiknowsys::runtime::config::RuntimeConfig& config);

// Flushes pending spans; safe to call when tracing never started.
void ShutdownTracing();

/*
  One span for the lifetime of the object, made current on construction.

  Attribute keys are namespaced under "aiknowsys." by the exporter side, so
  callers pass short keys ("count", "scope").
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // Sets error status; the span still ends in the destructor.
  void MarkFailed(std::string_view error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const aiknowsys::runtime::config::RuntimeConfig&) {
  return false;
}
inline void ShutdownTracing() {}

inline SpanScope::SpanScope(std::string_view) {}
inline SpanScope::~SpanScope() = default;
inline void SpanScope::SetAttribute(std::string_view, std::string_view) {}
inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {}
inline void SpanScope::MarkFailed(std::string_view) {}
#endif

} // namespace aiknowsys::observability
