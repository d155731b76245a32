#pragma once

#include "tracehop/telemetry/config.hpp"
#include "tracehop/telemetry/http_propagation.hpp"
#include "tracehop/telemetry/logger.hpp"
#include "tracehop/telemetry/messaging_interceptor.hpp"
#include "tracehop/telemetry/metric_exporter.hpp"
#include "tracehop/telemetry/metric_registry.hpp"
#include "tracehop/telemetry/metrics_endpoint.hpp"
#include "tracehop/telemetry/span_exporter.hpp"
#include "tracehop/telemetry/span_recorder.hpp"
#include <prometheus/registry.h>
#include <memory>
#include <mutex>

namespace tracehop {
namespace telemetry {

/**
 * Owns every telemetry component of a process.
 *
 * Construct once, hand the accessors to the code that needs them, call
 * shutdown() (or destroy) before exit to flush spans and metrics. Nothing
 * here is global: two providers are fully independent.
 *
 * When no span exporter is given, spans go to the OTLP/HTTP collector at
 * config.collector_endpoint. The periodic metric reader only runs when a
 * metric exporter is given; /metrics is always available on the endpoint.
 */
class TelemetryProvider {
public:
    explicit TelemetryProvider(const TelemetryConfig& config,
                               std::shared_ptr<SpanExporter> span_exporter = nullptr,
                               std::shared_ptr<MetricExporter> metric_exporter = nullptr);
    ~TelemetryProvider();

    TelemetryProvider(const TelemetryProvider&) = delete;
    TelemetryProvider& operator=(const TelemetryProvider&) = delete;

    const TelemetryConfig& config() const { return config_; }
    Logger& logger() { return logger_; }
    SpanRecorder& recorder() { return *recorder_; }
    MetricRegistry& metrics() { return *metrics_; }
    MessagingInterceptor& messaging() { return *messaging_; }
    HttpPropagation& http() { return *http_; }
    std::shared_ptr<prometheus::Registry> registry() const { return registry_; }

    // Binds config.metrics_endpoint
    bool start_metrics_endpoint();

    bool collector_healthy();

    // Stops the endpoint and the metric reader, flushes spans. Idempotent.
    void shutdown();

private:
    TelemetryConfig config_;
    Logger logger_;
    std::shared_ptr<prometheus::Registry> registry_;
    std::shared_ptr<SpanExporter> span_exporter_;
    std::unique_ptr<SpanRecorder> recorder_;
    std::unique_ptr<MetricRegistry> metrics_;
    std::unique_ptr<PeriodicMetricReader> metric_reader_;
    std::unique_ptr<MessagingInterceptor> messaging_;
    std::unique_ptr<HttpPropagation> http_;
    std::unique_ptr<MetricsEndpoint> endpoint_;

    std::mutex shutdown_mutex_;
    bool shut_down_ = false;
};

} // namespace telemetry
} // namespace tracehop
