#include <iostream>
#include "tracehop/telemetry/config.hpp"
#include "tracehop/telemetry/telemetry_provider.hpp"
#include <unistd.h>

int main() {
    std::unique_ptr<tracehop::telemetry::TelemetryProvider> provider;

    try {
        auto config = tracehop::telemetry::TelemetryConfig::from_env();
        provider = std::make_unique<tracehop::telemetry::TelemetryProvider>(config);

        auto& logger = provider->logger();
        logger.log_info("tracehop-agent starting", {
            {"pid", std::to_string(getpid())},
            {"metrics_endpoint", config.metrics_endpoint}
        });

        if (!provider->start_metrics_endpoint()) {
            logger.log_error("Metrics endpoint unavailable", {
                {"metrics_endpoint", config.metrics_endpoint}
            });
        }

        if (provider->collector_healthy()) {
            logger.log_info("Collector reachable", {
                {"health_endpoint", config.collector_health_endpoint}
            });
        } else {
            logger.log_warn("Collector not reachable, spans will be retried and may be dropped", {
                {"health_endpoint", config.collector_health_endpoint}
            });
        }

        logger.log_info("tracehop-agent is running. Press Enter to exit...");
        std::cin.get();

        logger.log_info("tracehop-agent shutting down");
        provider->shutdown();

    } catch (const std::exception& e) {
        if (provider) {
            provider->logger().log_error("tracehop-agent fatal error", {{"error", e.what()}});
        } else {
            // Configuration errors happen before the logger exists
            std::cerr << "tracehop-agent fatal error: " << e.what() << std::endl;
        }
        return 1;
    }

    return 0;
}
