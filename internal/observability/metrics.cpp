#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define LOTGATE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define LOTGATE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace lotgate::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Counter       = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;
using Histogram     = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>;

constexpr const char* kServiceName       = "lotgate";
constexpr uint32_t    kDefaultIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Explicit endpoint, then the standard OTEL env vars, then the collector
// default for the transport.
std::string ResolveEndpoint(const std::string& configured, bool http) {
  if (!configured.empty()) return configured;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;
  return http ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const lotgate::runtime::config::ObservabilityConfig& config) {
  const bool http     = config.transport() == lotgate::runtime::config::OTLP_TRANSPORT_HTTP;
  const auto endpoint = ResolveEndpoint(config.otlp_endpoint(), http);
  if (http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

void Count(const Counter& counter, std::initializer_list<AttributePair> attributes) {
  if (counter) AddWithAttributes(counter, static_cast<std::uint64_t>(1), attributes);
}

} // namespace

struct Metrics::Instruments {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Counter   rpc_count;
  Histogram rpc_latency_ms;
  Counter   decision_count;
  Histogram decision_latency_ms;
  Counter   barrier_transitions;
  Counter   payment_count;

  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> open_sessions_gauge;
  std::atomic<std::int64_t>                                           open_sessions{0};
};

bool InitializeMetrics(const lotgate::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : kDefaultIntervalMs);

#ifdef LOTGATE_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(observability), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeExporter(observability), reader_options);
#endif

  auto res   = resource::Resource::Create(resource::ResourceAttributes{{"service.name", kServiceName}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : instruments_(std::make_unique<Instruments>()) {
  auto& m = *instruments_;
  m.meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName, "0.1.0");

  m.rpc_count           = m.meter->CreateUInt64Counter("lotgate.rpc.count", "RPCs by route and outcome", "1");
  m.rpc_latency_ms      = m.meter->CreateDoubleHistogram("lotgate.rpc.latency_ms", "RPC latency by route", "ms");
  m.decision_count      = m.meter->CreateUInt64Counter("lotgate.decision.count", "Access decisions", "1");
  m.decision_latency_ms = m.meter->CreateDoubleHistogram("lotgate.decision.latency_ms", "Detection to decision latency", "ms");
  m.barrier_transitions = m.meter->CreateUInt64Counter("lotgate.barrier.transitions", "Barrier state transitions", "1");
  m.payment_count       = m.meter->CreateUInt64Counter("lotgate.payment.count", "Payment outcomes", "1");
  m.open_sessions_gauge = m.meter->CreateInt64ObservableGauge("lotgate.sessions.open", "Open parking sessions", "1");
  m.open_sessions_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* instruments = static_cast<Instruments*>(state);
        opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result)->Observe(
            instruments->open_sessions.load());
      },
      instruments_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, bool ok, double latency_ms) {
  const std::string route_value(route);
  Count(instruments_->rpc_count, {{"route", route_value}, {"ok", ok}});
  if (instruments_->rpc_latency_ms) {
    RecordWithAttributes(instruments_->rpc_latency_ms, latency_ms, std::initializer_list<AttributePair>{{"route", route_value}});
  }
}

void Metrics::RecordDecision(std::string_view direction, std::string_view reason, bool granted) {
  const std::string direction_value(direction);
  const std::string reason_value(reason);
  Count(instruments_->decision_count, {{"direction", direction_value}, {"reason", reason_value}, {"granted", granted}});
}

void Metrics::ObserveDecisionLatencyMs(double latency_ms) {
  if (!instruments_->decision_latency_ms) return;
  RecordWithAttributes(instruments_->decision_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordBarrierState(std::string_view barrier_id, std::string_view state) {
  const std::string barrier_value(barrier_id);
  const std::string state_value(state);
  Count(instruments_->barrier_transitions, {{"barrier", barrier_value}, {"state", state_value}});
}

void Metrics::RecordPayment(std::string_view outcome) {
  const std::string outcome_value(outcome);
  Count(instruments_->payment_count, {{"outcome", outcome_value}});
}

void Metrics::SetOpenSessions(std::int64_t count) {
  instruments_->open_sessions.store(count);
}

} // namespace lotgate::observability

#endif
