#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace trackmatch::observability {

OtlpTarget ResolveOtlpTarget(const trackmatch::runtime::config::ObservabilityConfig& config, const std::string& signal) {
  OtlpTarget target;
  target.http = config.transport() == trackmatch::runtime::config::OTLP_TRANSPORT_HTTP;

  std::string signal_var = "OTEL_EXPORTER_OTLP_" + signal + "_ENDPOINT";
  std::transform(signal_var.begin(), signal_var.end(), signal_var.begin(), [](unsigned char c) { return std::toupper(c); });

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_var.c_str())) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else {
    target.endpoint = target.http ? "http://localhost:4318/v1/" + signal : "localhost:4317";
  }
  return target;
}

opentelemetry::sdk::resource::Resource ServiceResource() {
  return opentelemetry::sdk::resource::Resource::Create({{"service.name", "trackmatch"}, {"service.version", "0.1.0"}});
}

} // namespace trackmatch::observability

#endif
