#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

#include "config/config.pb.h"

namespace trackmatch::observability {

struct OtlpTarget {
  std::string endpoint;
  bool        http{false};
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
// `signal` is "traces" or "metrics".
OtlpTarget ResolveOtlpTarget(const trackmatch::runtime::config::ObservabilityConfig& config, const std::string& signal);

opentelemetry::sdk::resource::Resource ServiceResource();

} // namespace trackmatch::observability

#endif
