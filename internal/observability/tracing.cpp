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

namespace saga::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
constexpr const char* kTracerName    = "saga-orchestrator";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

enum class OtlpTransport { kGrpc, kHttpProtobuf };

struct OtlpConfig {
  std::string   service_name{"saga-orchestrator"};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

opentelemetry::nostd::string_view View(std::string_view value) {
  return {value.data(), value.size()};
}

OtlpConfig FromRuntimeConfig(const saga::runtime::config::RuntimeConfig& config) {
  const auto& tracing = config.tracing();
  OtlpConfig  otlp_config;
  if (!tracing.service_name().empty()) otlp_config.service_name = tracing.service_name();
  otlp_config.endpoint  = tracing.endpoint();
  otlp_config.transport = tracing.transport() == "http" ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  return otlp_config;
}

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const saga::runtime::config::RuntimeConfig& config) {
  if (!config.tracing().enabled()) {
    ShutdownTracing();
    return false;
  }

  auto otlp_config    = FromRuntimeConfig(config);
  auto span_processor = sdktrace::BatchSpanProcessorFactory::Create(BuildExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  auto provider       = sdktrace::TracerProviderFactory::Create(
      std::move(span_processor), resource::Resource::Create(resource::ResourceAttributes{{"service.name", otlp_config.service_name}}));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct StepSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

StepSpan::StepSpan(const StepSpanInfo& info) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) return;

  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kInternal;
  impl_->span  = g_tracer->StartSpan(View(StepSpanName(info.phase)),
                                     {{"saga.execution_id", View(info.execution_id)},
                                      {"saga.type", View(info.saga_type)},
                                      {"saga.step", View(info.step)},
                                      {"saga.step_index", info.step_index},
                                      {"saga.attempt", info.attempt}},
                                     options);
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

StepSpan::~StepSpan() {
  if (!impl_->span) return;
  // leave the active context before ending so the parent is restored first
  impl_->scope.reset();
  impl_->span->End();
}

void StepSpan::Fail(std::string_view outcome, std::string_view message) {
  if (!impl_->span) return;
  impl_->span->SetAttribute("saga.step_outcome", View(outcome));
  impl_->span->SetStatus(trace_api::StatusCode::kError, View(message));
}

bool StepSpan::Recording() const {
  return impl_->span && impl_->span->IsRecording();
}

} // namespace saga::observability

#endif
