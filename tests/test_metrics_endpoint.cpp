#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "tracehop/telemetry/curl_transport.hpp"
#include "tracehop/telemetry/metric_registry.hpp"
#include "tracehop/telemetry/metrics_endpoint.hpp"

using namespace tracehop::telemetry;
using json = nlohmann::json;

static HttpResponse http_get(const std::string& url) {
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.timeout_ms = 2000;
    request.connect_timeout_ms = 1000;
    return CurlHttpTransport().send(request);
}

void test_health_response_format() {
    std::cout << "Testing health response format..." << std::endl;

    Logger logger("test", LogLevel::error);
    std::atomic<bool> collector_up{true};
    MetricsEndpoint endpoint(std::make_shared<prometheus::Registry>(), "order-service",
                             [&collector_up]() { return collector_up.load(); }, logger);

    json health = json::parse(endpoint.get_health_response());
    assert(health["status"] == "healthy");
    assert(health["collector"] == "up");
    assert(health["service"] == "order-service");
    assert(health.contains("timestamp"));

    collector_up = false;
    health = json::parse(endpoint.get_health_response());
    assert(health["status"] == "degraded");
    assert(health["collector"] == "down");

    std::cout << "✓ Health response format test passed" << std::endl;
}

void test_endpoint_serves_metrics_and_health() {
    std::cout << "Testing endpoint over HTTP..." << std::endl;

    std::ostringstream log_out;
    Logger logger("test", LogLevel::info);
    logger.set_streams(&log_out, &log_out);

    auto registry = std::make_shared<prometheus::Registry>();
    MetricRegistry metrics(registry);
    metrics.get_or_create("orders")->published().Increment(2);

    MetricsEndpoint endpoint(registry, "order-service", []() { return true; }, logger);
    uint16_t port = 19464; // High port to avoid conflicts
    assert(endpoint.start("127.0.0.1", port));
    assert(endpoint.running());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::string base = "http://127.0.0.1:" + std::to_string(port);

    HttpResponse metrics_response = http_get(base + "/metrics");
    assert(metrics_response.status_code == 200);
    assert(metrics_response.headers.at("content-type").find("text/plain") == 0);
    assert(metrics_response.body.find("messaging_published_total{destination=\"orders\"} 2") != std::string::npos);

    HttpResponse health_response = http_get(base + "/_health");
    assert(health_response.status_code == 200);
    assert(json::parse(health_response.body)["status"] == "healthy");

    HttpResponse missing = http_get(base + "/nope");
    assert(missing.status_code == 404);

    endpoint.stop();
    assert(!endpoint.running());
    assert(log_out.str().find("Metrics endpoint started") != std::string::npos);

    std::cout << "✓ HTTP endpoint test passed" << std::endl;
}

void test_invalid_address_rejected() {
    std::cout << "Testing invalid bind address..." << std::endl;

    std::ostringstream log_out;
    Logger logger("test", LogLevel::info);
    logger.set_streams(&log_out, &log_out);

    MetricsEndpoint endpoint(std::make_shared<prometheus::Registry>(), "order-service", nullptr, logger);
    assert(!endpoint.start("not-an-address", 19465));
    assert(!endpoint.running());
    assert(log_out.str().find("Invalid metrics endpoint address") != std::string::npos);

    std::cout << "✓ Invalid address test passed" << std::endl;
}

void test_transport_error_when_closed() {
    std::cout << "Testing transport error on closed port..." << std::endl;

    bool threw = false;
    try {
        http_get("http://127.0.0.1:19466/metrics");
    } catch (const TransportError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ Transport error test passed" << std::endl;
}

int main() {
    std::cout << "=== Metrics Endpoint Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_health_response_format();
        test_endpoint_serves_metrics_and_health();
        test_invalid_address_rejected();
        test_transport_error_when_closed();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
