#pragma once

#include "tracehop/telemetry/logger.hpp"
#include <prometheus/registry.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tracehop {
namespace telemetry {

/**
 * Minimal pull endpoint.
 *
 *   GET /metrics  -> Prometheus text format of the registry
 *   GET /_health  -> {"status": "healthy"|"degraded", "timestamp", "collector", "service"}
 *
 * Anything else is answered with 404. One request per connection.
 */
class MetricsEndpoint {
public:
    using HealthCheck = std::function<bool()>;

    MetricsEndpoint(std::shared_ptr<prometheus::Registry> registry,
                    std::string service_name,
                    HealthCheck collector_healthy,
                    Logger& logger);
    ~MetricsEndpoint();

    MetricsEndpoint(const MetricsEndpoint&) = delete;
    MetricsEndpoint& operator=(const MetricsEndpoint&) = delete;

    // Returns false (and logs) when the socket cannot be bound
    bool start(const std::string& address, uint16_t port);
    void stop();
    bool running() const { return running_; }

    std::string get_metrics_response() const;
    std::string get_health_response() const;

private:
    void server_loop(int socket_fd);

    std::shared_ptr<prometheus::Registry> registry_;
    std::string service_name_;
    HealthCheck collector_healthy_;
    Logger& logger_;

    std::atomic<bool> running_{false};
    int server_socket_ = -1;
    std::thread server_thread_;
};

} // namespace telemetry
} // namespace tracehop
