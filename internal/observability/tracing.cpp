#include "internal/observability/tracing.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace trackmatch::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider> g_provider;

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer("trackmatch", "0.1.0");
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = target.endpoint;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const trackmatch::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  auto exporter  = MakeExporter(ResolveOtlpTarget(config.observability(), "traces"));
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), ServiceResource()));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  return true;
}

void ShutdownTracing() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(std::move(s)), scope(span) {
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>(Tracer()->StartSpan(std::string(name)))) {
}

SpanScope::~SpanScope() {
  impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace trackmatch::observability

#endif
