#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>

#include <utility>

#include "internal/observability/otlp_settings.hpp"

namespace circulate::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider> g_provider;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const detail::OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    if (!settings.endpoint.empty()) options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  if (!settings.endpoint.empty()) options.endpoint = settings.endpoint;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

template <std::size_t N>
std::string Hex(opentelemetry::nostd::span<const uint8_t, N> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(N * 2);
  for (auto b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

} // namespace

bool InitializeTracing(const circulate::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) return false;

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(detail::ResolveOtlp(config.observability())),
                                                               sdktrace::BatchSpanProcessorOptions{});
  g_provider     = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), detail::ServiceResource()));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  return true;
}

void ShutdownTracing() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

std::optional<TraceIds> ActiveTraceIds() {
  auto span = trace_api::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return std::nullopt;

  const auto context = span->GetContext();
  if (!context.IsValid()) return std::nullopt;
  return TraceIds{Hex(context.trace_id().Id()), Hex(context.span_id().Id())};
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = trace_api::Provider::GetTracerProvider()->GetTracer("circulate");
  impl_       = std::make_unique<Impl>(tracer->StartSpan(std::string(name)));
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

void SpanScope::RecordError(std::string_view description) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace circulate::observability

#endif
