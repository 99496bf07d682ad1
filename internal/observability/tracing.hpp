#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace trackmatch::runtime::config {
class RuntimeConfig;
}

namespace trackmatch::observability {

// Installs the OTLP tracer provider when observability.tracing_enabled is
// set. Returns false when tracing stays off.
bool InitializeTracing(const trackmatch::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span, active for the lifetime of the scope. Compiles to nothing
  without ENABLE_OTEL.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const trackmatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace trackmatch::observability
