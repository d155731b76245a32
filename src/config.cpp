#include "tracehop/telemetry/config.hpp"
#include "tracehop/telemetry/env.hpp"
#include <algorithm>
#include <stdexcept>

namespace tracehop {
namespace telemetry {

TelemetryConfig TelemetryConfig::from_env() {
    TelemetryConfig config;

    config.service_name = Env::get_string("OTEL_SERVICE_NAME", config.service_name);
    config.service_version = Env::get_string("TRACEHOP_SERVICE_VERSION", config.service_version);
    config.environment = Env::get_string("TRACEHOP_ENVIRONMENT", config.environment);

    config.collector_endpoint = Env::get_string("OTEL_EXPORTER_OTLP_ENDPOINT", config.collector_endpoint);
    config.collector_health_endpoint =
        Env::get_string("TRACEHOP_COLLECTOR_HEALTH_ENDPOINT", config.collector_health_endpoint);

    double ratio = Env::get_double("OTEL_TRACES_SAMPLER_ARG", config.sample_ratio);
    config.sample_ratio = std::min(1.0, std::max(0.0, ratio));

    int64_t queue_size = Env::get_int("OTEL_BSP_MAX_QUEUE_SIZE", static_cast<int64_t>(config.max_queue_size));
    if (queue_size > 0) {
        config.max_queue_size = static_cast<size_t>(queue_size);
    }
    int64_t batch_size =
        Env::get_int("OTEL_BSP_MAX_EXPORT_BATCH_SIZE", static_cast<int64_t>(config.max_export_batch_size));
    if (batch_size > 0) {
        config.max_export_batch_size = static_cast<size_t>(batch_size);
    }
    config.schedule_delay_ms = Env::get_int("OTEL_BSP_SCHEDULE_DELAY", config.schedule_delay_ms);
    config.export_timeout_ms = Env::get_int("OTEL_BSP_EXPORT_TIMEOUT", config.export_timeout_ms);
    config.max_export_attempts =
        static_cast<int32_t>(Env::get_int("TRACEHOP_EXPORT_MAX_ATTEMPTS", config.max_export_attempts));

    config.metric_export_interval_ms =
        Env::get_int("OTEL_METRIC_EXPORT_INTERVAL", config.metric_export_interval_ms);
    config.metrics_endpoint = Env::get_string("TRACEHOP_METRICS_ENDPOINT", config.metrics_endpoint);

    config.log_level = Env::get_string("TRACEHOP_LOG_LEVEL", config.log_level);
    config.redelivery_header = Env::get_string("TRACEHOP_REDELIVERY_HEADER", config.redelivery_header);

    return config;
}

void TelemetryConfig::validate() const {
    if (service_name.empty()) {
        throw std::invalid_argument("service_name must not be empty");
    }
    if (max_export_batch_size == 0) {
        throw std::invalid_argument("max_export_batch_size must be positive");
    }
    if (max_export_batch_size > max_queue_size) {
        throw std::invalid_argument("max_export_batch_size must not exceed max_queue_size");
    }
    if (max_export_attempts < 1) {
        throw std::invalid_argument("max_export_attempts must be at least 1");
    }
    if (schedule_delay_ms <= 0 || metric_export_interval_ms <= 0) {
        throw std::invalid_argument("export intervals must be positive");
    }
}

std::pair<std::string, uint16_t> TelemetryConfig::metrics_address() const {
    std::string address = "0.0.0.0";
    uint16_t port = 9464;

    size_t colon_pos = metrics_endpoint.rfind(':');
    if (colon_pos == std::string::npos) {
        return {metrics_endpoint.empty() ? address : metrics_endpoint, port};
    }
    if (colon_pos > 0) {
        address = metrics_endpoint.substr(0, colon_pos);
    }
    try {
        int parsed = std::stoi(metrics_endpoint.substr(colon_pos + 1));
        if (parsed > 0 && parsed <= 65535) {
            port = static_cast<uint16_t>(parsed);
        }
    } catch (const std::exception&) {
        // keep the default port
    }
    return {address, port};
}

} // namespace telemetry
} // namespace tracehop
