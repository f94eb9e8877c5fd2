#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace aiknowsys::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using aiknowsys::runtime::config::OTLP_TRANSPORT_HTTP;
using aiknowsys::runtime::config::RuntimeConfig;
using aiknowsys::runtime::config::TracingConfig;

namespace {

constexpr const char* kInstrumentation = "aiknowsys";
constexpr const char* kVersion         = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

std::string Endpoint(const TracingConfig& tracing) {
  if (!tracing.endpoint().empty()) return tracing.endpoint();
  if (const char* env = Env("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) return env;
  if (const char* env = Env("OTEL_EXPORTER_OTLP_ENDPOINT")) return env;
  return tracing.transport() == OTLP_TRANSPORT_HTTP ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::string ServiceName(const TracingConfig& tracing) {
  if (!tracing.service_name().empty()) return tracing.service_name();
  if (const char* env = Env("OTEL_SERVICE_NAME")) return env;
  return "aiknowsysctl";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const TracingConfig& tracing, const std::string& endpoint) {
  if (tracing.transport() == OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = endpoint;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::string AttributeKey(std::string_view key) {
  return "aiknowsys." + std::string(key);
}

} // namespace

bool InitializeTracing(const RuntimeConfig& config) {
  ShutdownTracing();
  const auto& tracing = config.tracing();
  if (!tracing.enabled()) return false;

  const auto endpoint = Endpoint(tracing);
  const auto service  = ServiceName(tracing);

  resource::ResourceAttributes attrs = {{"service.name", service}, {"service.version", std::string(kVersion)}};

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(tracing, endpoint), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs));

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kInstrumentation, kVersion);

  AIKNOWSYS_LOG_DEBUG("tracing enabled", {StringField("endpoint", endpoint), StringField("service", service)});
  return true;
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (!g_provider) return;

  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 active;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) return;
  impl_->span   = g_tracer->StartSpan(std::string(name));
  impl_->active = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_->span) return;
  impl_->active.reset();
  impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_->span) impl_->span->SetAttribute(AttributeKey(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_->span) impl_->span->SetAttribute(AttributeKey(key), value);
}

void SpanScope::MarkFailed(std::string_view error) {
  if (!impl_->span) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(error)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(error));
}

} // namespace aiknowsys::observability

#endif
