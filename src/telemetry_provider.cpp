#include "tracehop/telemetry/telemetry_provider.hpp"
#include "tracehop/telemetry/otlp_http_exporter.hpp"
#include "tracehop/telemetry/sampler.hpp"

namespace tracehop {
namespace telemetry {

TelemetryProvider::TelemetryProvider(const TelemetryConfig& config,
                                     std::shared_ptr<SpanExporter> span_exporter,
                                     std::shared_ptr<MetricExporter> metric_exporter)
    : config_(config),
      logger_("tracehop", parse_log_level(config.log_level)),
      registry_(std::make_shared<prometheus::Registry>()),
      span_exporter_(std::move(span_exporter)) {
    config_.validate();

    if (!span_exporter_) {
        span_exporter_ = std::make_shared<OtlpHttpSpanExporter>(config_);
    }

    recorder_ = std::make_unique<SpanRecorder>(span_exporter_,
                                               RatioSampler(config_.sample_ratio),
                                               RecorderOptions::from_config(config_),
                                               logger_,
                                               registry_);
    metrics_ = std::make_unique<MetricRegistry>(registry_);

    if (metric_exporter) {
        metric_reader_ = std::make_unique<PeriodicMetricReader>(
            registry_, std::move(metric_exporter),
            std::chrono::milliseconds(config_.metric_export_interval_ms), logger_);
        metric_reader_->start();
    }

    MessagingOptions messaging_options;
    messaging_options.is_redelivery = header_presence_marker(config_.redelivery_header);
    messaging_ = std::make_unique<MessagingInterceptor>(*recorder_, *metrics_, logger_, messaging_options);
    http_ = std::make_unique<HttpPropagation>(*recorder_, *metrics_, logger_);

    logger_.log_info("Telemetry initialized", {
        {"service_name", config_.service_name},
        {"service_version", config_.service_version},
        {"environment", config_.environment},
        {"collector_endpoint", config_.collector_endpoint},
        {"sample_ratio", std::to_string(config_.sample_ratio)}
    });
}

TelemetryProvider::~TelemetryProvider() {
    shutdown();
}

bool TelemetryProvider::start_metrics_endpoint() {
    if (!endpoint_) {
        endpoint_ = std::make_unique<MetricsEndpoint>(
            registry_, config_.service_name,
            [this]() { return collector_healthy(); },
            logger_);
    }
    auto [address, port] = config_.metrics_address();
    return endpoint_->start(address, port);
}

bool TelemetryProvider::collector_healthy() {
    try {
        return span_exporter_->is_healthy();
    } catch (const std::exception& e) {
        logger_.log_warn("Collector health check failed", {
            {"error", e.what()}
        });
        return false;
    }
}

void TelemetryProvider::shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    if (endpoint_) {
        endpoint_->stop();
    }
    if (metric_reader_) {
        metric_reader_->stop();
    }

    bool flushed = recorder_->force_flush(std::chrono::milliseconds(config_.export_timeout_ms));
    recorder_->shutdown();

    logger_.log_info("Telemetry shut down", {
        {"spans_exported", std::to_string(recorder_->exported_spans())},
        {"spans_dropped", std::to_string(recorder_->dropped_spans())},
        {"flush_completed", flushed ? "true" : "false"}
    });
}

} // namespace telemetry
} // namespace tracehop
