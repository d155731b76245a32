#include <iostream>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include "tracehop/telemetry/metric_exporter.hpp"
#include "tracehop/telemetry/span_exporter.hpp"
#include "tracehop/telemetry/telemetry_provider.hpp"

using namespace tracehop::telemetry;

static TelemetryConfig test_config() {
    TelemetryConfig config;
    config.service_name = "order-service";
    config.log_level = "error";
    config.schedule_delay_ms = 60000;
    config.metric_export_interval_ms = 60000;
    config.export_timeout_ms = 2000;
    return config;
}

void test_shutdown_flushes_spans_and_metrics() {
    std::cout << "Testing shutdown flushes spans and metrics..." << std::endl;

    auto spans = std::make_shared<InMemorySpanExporter>();
    auto metrics = std::make_shared<InMemoryMetricExporter>();
    TelemetryProvider provider(test_config(), spans, metrics);

    auto publish = provider.messaging().wrap_publish([](const MessageEnvelope&) {});
    MessageEnvelope message;
    message.routing_key = "orders";
    message.body = "{}";
    publish(message);

    assert(spans->finished_spans().empty());

    provider.shutdown();
    assert(spans->finished_spans().size() == 1);
    assert(spans->finished_spans()[0].name == "publish orders");
    assert(metrics->export_count() >= 1);
    assert(provider.recorder().exported_spans() == 1);

    // Idempotent
    provider.shutdown();
    assert(spans->finished_spans().size() == 1);

    std::cout << "✓ Shutdown flush test passed" << std::endl;
}

void test_providers_are_independent() {
    std::cout << "Testing two providers do not share state..." << std::endl;

    auto first_spans = std::make_shared<InMemorySpanExporter>();
    auto second_spans = std::make_shared<InMemorySpanExporter>();
    TelemetryProvider first(test_config(), first_spans);
    TelemetryProvider second(test_config(), second_spans);

    first.metrics().get_or_create("orders")->published().Increment();
    assert(second.metrics().get_or_create("orders")->published().Value() == 0);
    assert(first.registry() != second.registry());

    {
        SpanScope scope(first.recorder(), first.recorder().start_span("job", SpanKind::internal));
    }
    first.shutdown();
    second.shutdown();
    assert(first_spans->finished_spans().size() == 1);
    assert(second_spans->finished_spans().empty());

    std::cout << "✓ Independent providers test passed" << std::endl;
}

void test_redelivery_header_from_config() {
    std::cout << "Testing configured redelivery header..." << std::endl;

    TelemetryConfig config = test_config();
    config.redelivery_header = "x-retry-count";
    TelemetryProvider provider(config, std::make_shared<InMemorySpanExporter>());

    auto consume = provider.messaging().wrap_consumer("orders", [](const Delivery&) {});
    Delivery delivery;
    delivery.message.headers["x-retry-count"] = "2";
    consume(delivery);

    assert(provider.metrics().get_or_create("orders")->retries().Value() == 1);

    std::cout << "✓ Redelivery header test passed" << std::endl;
}

void test_invalid_config_rejected() {
    std::cout << "Testing invalid configuration..." << std::endl;

    TelemetryConfig config = test_config();
    config.max_export_batch_size = config.max_queue_size + 1;

    bool threw = false;
    try {
        TelemetryProvider provider(config, std::make_shared<InMemorySpanExporter>());
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ Invalid configuration test passed" << std::endl;
}

void test_collector_health_from_exporter() {
    std::cout << "Testing collector health delegation..." << std::endl;

    TelemetryProvider provider(test_config(), std::make_shared<InMemorySpanExporter>());
    assert(provider.collector_healthy());

    std::cout << "✓ Collector health test passed" << std::endl;
}

int main() {
    std::cout << "=== Telemetry Provider Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_shutdown_flushes_spans_and_metrics();
        test_providers_are_independent();
        test_redelivery_header_from_config();
        test_invalid_config_rejected();
        test_collector_health_from_exporter();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
