#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace tracehop {
namespace telemetry {

// Process-wide telemetry settings
struct TelemetryConfig {
    // Resource identity
    std::string service_name = "tracehop-service";
    std::string service_version = "1.0.0";
    std::string environment = "homelab";

    // Collector (OTLP/HTTP) and its health-check extension
    std::string collector_endpoint = "http://localhost:4318";
    std::string collector_health_endpoint = "http://localhost:13133/";

    // Ratio of new traces that are sampled, 0.0 .. 1.0
    double sample_ratio = 1.0;

    // Span export buffering
    size_t max_queue_size = 2048;
    size_t max_export_batch_size = 512;
    int64_t schedule_delay_ms = 5000;
    int64_t export_timeout_ms = 10000;
    int32_t max_export_attempts = 3;
    int64_t export_backoff_base_ms = 100;
    int64_t export_backoff_max_ms = 5000;

    // Metrics
    int64_t metric_export_interval_ms = 60000;
    std::string metrics_endpoint = "0.0.0.0:9464";

    std::string log_level = "info";

    // Header the broker attaches when a message comes back from the delay queue
    std::string redelivery_header = "x-first-death-exchange";

    static TelemetryConfig from_env();

    // Throws std::invalid_argument on inconsistent values
    void validate() const;

    // Splits metrics_endpoint ("address:port") into its parts
    std::pair<std::string, uint16_t> metrics_address() const;
};

} // namespace telemetry
} // namespace tracehop
