#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <chrono>
#include <utility>

#include "internal/observability/otlp_settings.hpp"

namespace circulate::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

constexpr std::uint32_t kDefaultIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const detail::OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    if (!settings.endpoint.empty()) options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  if (!settings.endpoint.empty()) options.endpoint = settings.endpoint;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const circulate::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) return false;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : kDefaultIntervalMs);

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(detail::ResolveOtlp(observability)), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), detail::ServiceResource());
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

// Instruments bind to whichever provider is installed when Instance() is
// first called, so InitializeMetrics() must run before any task does.
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_acquires;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> task_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> task_retries;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      task_duration;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> upload_parts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> upload_bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> upload_aborts;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("circulate");

  impl_->lock_acquires = meter->CreateUInt64Counter("circulate.lock.acquires", "Lock and upload session acquisitions by result", "1");
  impl_->task_outcomes = meter->CreateUInt64Counter("circulate.task.outcomes", "Task invocations by outcome", "1");
  impl_->task_retries  = meter->CreateUInt64Counter("circulate.task.retries", "Requests re-enqueued after a transient error", "1");
  impl_->task_duration = meter->CreateDoubleHistogram("circulate.task.duration", "Task invocation wall time", "ms");
  impl_->upload_parts  = meter->CreateUInt64Counter("circulate.upload.parts", "Multipart upload parts written", "1");
  impl_->upload_bytes  = meter->CreateUInt64Counter("circulate.upload.bytes", "Bytes sent as multipart upload parts", "By");
  impl_->upload_aborts = meter->CreateUInt64Counter("circulate.upload.aborts", "Multipart uploads aborted with their session", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordLockAcquire(std::string_view lock_type, std::string_view result) {
  impl_->lock_acquires->Add(1, {{"lock_type", std::string(lock_type)}, {"result", std::string(result)}});
}

void Metrics::RecordTaskOutcome(std::string_view task, std::string_view outcome) {
  impl_->task_outcomes->Add(1, {{"task", std::string(task)}, {"outcome", std::string(outcome)}});
}

void Metrics::RecordTaskRetry(std::string_view task) {
  impl_->task_retries->Add(1, {{"task", std::string(task)}});
}

void Metrics::ObserveTaskDurationMs(std::string_view task, double duration_ms) {
  impl_->task_duration->Record(duration_ms, {{"task", std::string(task)}}, opentelemetry::context::Context{});
}

void Metrics::RecordPartUploaded(std::uint64_t bytes) {
  impl_->upload_parts->Add(1);
  impl_->upload_bytes->Add(bytes);
}

void Metrics::RecordUploadAborted() {
  impl_->upload_aborts->Add(1);
}

} // namespace circulate::observability

#endif
