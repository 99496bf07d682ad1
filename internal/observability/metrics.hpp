#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace trackmatch::runtime::config {
class RuntimeConfig;
}

namespace trackmatch::observability {

// Installs the OTLP meter provider when observability.metrics_enabled is
// set. Must run before the first Metrics::Instance() call.
bool InitializeMetrics(const trackmatch::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide instruments:

    trackmatch.rpc.count / trackmatch.rpc.latency_ms     per route and result
    trackmatch.search.tier_outcomes                      per tier, matched/empty/provider_error
    trackmatch.search.tier_duration_ms                   submit to cleanup
    trackmatch.analysis.verdicts                         per verdict class
    trackmatch.requests.in_flight                        gauge, search/verify
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRpc(std::string_view route, bool ok, double latency_ms);
  void RecordTierOutcome(std::string_view tier, std::string_view outcome);
  void ObserveTierDuration(std::string_view tier, double duration_ms);
  void RecordVerdict(std::string_view verdict);
  void SetInFlight(std::string_view kind, std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const trackmatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, bool, double) {
}

inline void Metrics::RecordTierOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveTierDuration(std::string_view, double) {
}

inline void Metrics::RecordVerdict(std::string_view) {
}

inline void Metrics::SetInFlight(std::string_view, std::int64_t) {
}
#endif

} // namespace trackmatch::observability
