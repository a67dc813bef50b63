#include "internal/observability/spans.hpp"

#ifdef DOCFLOW_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define DOCFLOW_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define DOCFLOW_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "docflow/runtime/config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace docflow::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using MetricsConfig = docflow::runtime::config::ObservabilityConfig_MetricsConfig;

// Attribute values are string_views; the map keeps the backing strings
// alive for the duration of one Add/Record call.
using Labels = std::map<std::string, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Toggles read on every request; written once at startup.
std::atomic<bool> g_request_metrics{true};
std::atomic<bool> g_latency_histograms{true};
std::atomic<bool> g_route_labels{true};
std::atomic<bool> g_lock_metrics{true};

constexpr std::uint32_t kDefaultCollectionIntervalMs = 1000;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> BuildReader(const MetricsConfig& config, std::unique_ptr<sdkmetrics::PushMetricExporter> exporter) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;

  const auto interval_ms = config.collection_interval_ms() > 0 ? config.collection_interval_ms() : kDefaultCollectionIntervalMs;
  options.export_interval_millis = std::chrono::milliseconds(std::max(config.min_collection_interval_ms(), interval_ms));
  if (config.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(config.export_timeout_ms());
  }

#ifdef DOCFLOW_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), options);
#endif
}

template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, const Labels& labels) {
  if constexpr (requires { instrument->Add(value, labels, opentelemetry::context::Context{}); }) {
    instrument->Add(value, labels, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, labels);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, const Labels& labels) {
  if constexpr (requires { instrument->Record(value, labels, opentelemetry::context::Context{}); }) {
    instrument->Record(value, labels, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, labels);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      lock_wait_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_timeouts;
};

bool InitializeMetrics(const docflow::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metric_config = observability.metrics();
  auto        reader        = BuildReader(metric_config, BuildExporter(ResolveOtlpTarget(config, "metrics")));

  auto res   = resource::Resource::Create({{"service.name", kServiceName}, {"service.version", kServiceVersion}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  AttachReader(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_request_metrics    = metric_config.request_metrics_enabled();
  g_latency_histograms = metric_config.request_latency_histograms_enabled();
  g_route_labels       = metric_config.route_labels_enabled();
  g_lock_metrics       = metric_config.lock_metrics_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is installed on first use, so
// InitializeMetrics must run before the first request.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName, kServiceVersion);

  impl_->request_count      = impl_->meter->CreateUInt64Counter("docflow.request.count", "Workflow requests handled", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("docflow.request.latency_ms", "Workflow request latency", "ms");
  impl_->lock_wait_ms       = impl_->meter->CreateDoubleHistogram("docflow.lock.wait_ms", "Time spent waiting for a business-key lock", "ms");
  impl_->lock_timeouts      = impl_->meter->CreateUInt64Counter("docflow.lock.timeouts", "Lock waits that ran out of budget", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!g_request_metrics) {
    return;
  }

  const std::string route_label(route);
  Labels            labels{{"success", success}};
  if (g_route_labels) {
    labels.emplace("route", route_label);
  }
  Add(impl_->request_count, static_cast<std::uint64_t>(1), labels);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!g_request_metrics || !g_latency_histograms) {
    return;
  }

  const std::string route_label(route);
  Labels            labels;
  if (g_route_labels) {
    labels.emplace("route", route_label);
  }
  Record(impl_->request_latency_ms, latency_ms, labels);
}

void Metrics::ObserveLockWaitMs(std::string_view entity, double wait_ms, bool acquired) {
  if (!g_lock_metrics) {
    return;
  }

  const std::string entity_label(entity);
  Record(impl_->lock_wait_ms, wait_ms, Labels{{"entity", entity_label}, {"acquired", acquired}});
  if (!acquired) {
    Add(impl_->lock_timeouts, static_cast<std::uint64_t>(1), Labels{{"entity", entity_label}});
  }
}

} // namespace docflow::observability

#endif
