#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry_factory.h>

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace trackmatch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

constexpr std::uint32_t kDefaultCollectionMs = 5000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint = target.endpoint;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const trackmatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    return false;
  }

  const auto& tuning = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(tuning.collection_interval_ms() > 0 ? tuning.collection_interval_ms() : kDefaultCollectionMs);
  if (tuning.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(tuning.export_timeout_ms());
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(ResolveOtlpTarget(observability, "metrics")), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(sdkmetrics::ViewRegistryFactory::Create(), ServiceResource());
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> tier_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      tier_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> verdicts;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   in_flight;

  std::mutex                          in_flight_mutex;
  std::map<std::string, std::int64_t> in_flight_counts;

  static void ObserveInFlight(metrics_api::ObserverResult result, void* state) {
    auto* impl = static_cast<Impl*>(state);
    auto  observer =
        opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);

    std::lock_guard lock(impl->in_flight_mutex);
    for (const auto& [kind, count] : impl->in_flight_counts) {
      observer->Observe(count, Attributes{{"kind", kind}});
    }
  }
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("trackmatch", "0.1.0");

  impl_->rpc_count        = impl_->meter->CreateUInt64Counter("trackmatch.rpc.count", "MatchService calls", "1");
  impl_->rpc_latency_ms   = impl_->meter->CreateDoubleHistogram("trackmatch.rpc.latency_ms", "MatchService call latency", "ms");
  impl_->tier_outcomes    = impl_->meter->CreateUInt64Counter("trackmatch.search.tier_outcomes", "Search tiers by result", "1");
  impl_->tier_duration_ms = impl_->meter->CreateDoubleHistogram("trackmatch.search.tier_duration_ms", "Search tier wall time", "ms");
  impl_->verdicts         = impl_->meter->CreateUInt64Counter("trackmatch.analysis.verdicts", "Authenticity verdicts", "1");
  impl_->in_flight        = impl_->meter->CreateInt64ObservableGauge("trackmatch.requests.in_flight", "Requests being served", "1");
  impl_->in_flight->AddCallback(&Impl::ObserveInFlight, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, bool ok, double latency_ms) {
  const std::string route_name(route);
  impl_->rpc_count->Add(1, Attributes{{"route", route_name}, {"ok", ok}});
  impl_->rpc_latency_ms->Record(latency_ms, Attributes{{"route", route_name}}, opentelemetry::context::Context{});
}

void Metrics::RecordTierOutcome(std::string_view tier, std::string_view outcome) {
  impl_->tier_outcomes->Add(1, Attributes{{"tier", std::string(tier)}, {"outcome", std::string(outcome)}});
}

void Metrics::ObserveTierDuration(std::string_view tier, double duration_ms) {
  impl_->tier_duration_ms->Record(duration_ms, Attributes{{"tier", std::string(tier)}}, opentelemetry::context::Context{});
}

void Metrics::RecordVerdict(std::string_view verdict) {
  impl_->verdicts->Add(1, Attributes{{"verdict", std::string(verdict)}});
}

void Metrics::SetInFlight(std::string_view kind, std::int64_t count) {
  std::lock_guard lock(impl_->in_flight_mutex);
  impl_->in_flight_counts[std::string(kind)] = count;
}

} // namespace trackmatch::observability

#endif
