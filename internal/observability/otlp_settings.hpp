#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

#include "config/config.pb.h"

namespace circulate::observability::detail {

// Exporter settings shared by the trace and metric pipelines. An empty
// endpoint leaves the exporter on its own default, which already honours
// OTEL_EXPORTER_OTLP_ENDPOINT and the per-signal variables.
struct OtlpSettings {
  bool        http = false;
  std::string endpoint;
};

inline OtlpSettings ResolveOtlp(const circulate::runtime::config::ObservabilityConfig& config) {
  OtlpSettings settings;
  settings.http     = config.transport() == circulate::runtime::config::OTLP_TRANSPORT_HTTP;
  settings.endpoint = config.otlp_endpoint();
  return settings;
}

inline opentelemetry::sdk::resource::Resource ServiceResource() {
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", "circulate"}};
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace circulate::observability::detail

#endif
