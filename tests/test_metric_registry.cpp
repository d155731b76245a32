#include <iostream>
#include <cassert>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "tracehop/telemetry/logger.hpp"
#include "tracehop/telemetry/metric_exporter.hpp"
#include "tracehop/telemetry/metric_registry.hpp"
#include "support/test_telemetry.hpp"

using namespace tracehop::telemetry;
using tracehop::telemetry::testing::histogram_count;
using tracehop::telemetry::testing::histogram_sum;

// Value of a counter sample with the given destination label, -1 when absent
static double counter_value(const std::vector<prometheus::MetricFamily>& families,
                            const std::string& name,
                            const std::string& destination) {
    for (const auto& family : families) {
        if (family.name != name) {
            continue;
        }
        for (const auto& metric : family.metric) {
            for (const auto& label : metric.label) {
                if (label.name == "destination" && label.value == destination) {
                    return metric.counter.value;
                }
            }
        }
    }
    return -1;
}

void test_same_destination_same_instance() {
    std::cout << "Testing idempotent instrument creation..." << std::endl;

    MetricRegistry metrics(std::make_shared<prometheus::Registry>());

    auto first = metrics.get_or_create("orders");
    auto second = metrics.get_or_create("orders");
    auto other = metrics.get_or_create("payments");

    assert(first.get() == second.get());
    assert(first.get() != other.get());
    assert(&first->published() == &second->published());
    assert(metrics.size() == 2);
    assert(first->destination() == "orders");

    std::cout << "✓ Idempotent creation test passed" << std::endl;
}

void test_concurrent_first_access() {
    std::cout << "Testing concurrent first access..." << std::endl;

    MetricRegistry metrics(std::make_shared<prometheus::Registry>());
    const int thread_count = 16;
    const int increments = 1000;

    std::vector<InstrumentSet*> seen(thread_count, nullptr);
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&metrics, &seen, t, increments]() {
            auto set = metrics.get_or_create("orders");
            seen[t] = set.get();
            for (int i = 0; i < increments; ++i) {
                metrics.get_or_create("orders")->published().Increment();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int t = 1; t < thread_count; ++t) {
        assert(seen[t] == seen[0]);
    }
    assert(metrics.size() == 1);
    assert(metrics.get_or_create("orders")->published().Value() == thread_count * increments);

    std::cout << "✓ Concurrent first access test passed" << std::endl;
}

void test_destination_label_exported() {
    std::cout << "Testing destination label..." << std::endl;

    auto registry = std::make_shared<prometheus::Registry>();
    MetricRegistry metrics(registry);

    metrics.get_or_create("orders")->published().Increment(3);
    metrics.get_or_create("payments")->consumed().Increment();

    auto families = registry->Collect();
    assert(counter_value(families, "messaging_published_total", "orders") == 3);
    assert(counter_value(families, "messaging_consumed_total", "payments") == 1);
    assert(counter_value(families, "messaging_published_total", "payments") == 0);

    std::cout << "✓ Destination label test passed" << std::endl;
}

void test_histograms_record() {
    std::cout << "Testing histogram recording..." << std::endl;

    MetricRegistry metrics(std::make_shared<prometheus::Registry>());
    auto set = metrics.get_or_create("orders");

    set->message_size().Observe(120);
    set->message_size().Observe(80);
    set->processing_time().Observe(12.5);

    assert(histogram_count(set->message_size()) == 2);
    assert(histogram_sum(set->message_size()) == 200);
    assert(histogram_count(set->processing_time()) == 1);
    assert(histogram_count(set->queue_time()) == 0);

    std::cout << "✓ Histogram test passed" << std::endl;
}

void test_http_instruments_per_method() {
    std::cout << "Testing HTTP instruments per method and error kind..." << std::endl;

    auto registry = std::make_shared<prometheus::Registry>();
    MetricRegistry metrics(registry);
    auto set = metrics.get_or_create_http("http://inventory:8080/items");
    assert(set == metrics.get_or_create_http("http://inventory:8080/items"));

    assert(&set->request_duration("GET") == &set->request_duration("GET"));
    assert(&set->request_duration("GET") != &set->request_duration("POST"));
    assert(&set->errors("http_5xx") == &set->errors("http_5xx"));

    set->errors("http_5xx").Increment();
    assert(set->errors("http_5xx").Value() == 1);
    assert(set->errors("transport").Value() == 0);

    // HTTP destinations do not create messaging series
    assert(metrics.http_size() == 1);
    assert(metrics.size() == 0);
    auto families = registry->Collect();
    assert(counter_value(families, "messaging_published_total", "http://inventory:8080/items") == -1);
    assert(counter_value(families, "messaging_retries_total", "http://inventory:8080/items") == -1);
    assert(counter_value(families, "http_errors_total", "http://inventory:8080/items") >= 0);

    // Same name in both keyspaces yields independent sets
    metrics.get_or_create("orders")->published().Increment();
    metrics.get_or_create_http("orders")->errors("http_4xx").Increment();
    assert(metrics.size() == 1);
    assert(metrics.http_size() == 2);

    std::cout << "✓ HTTP instruments test passed" << std::endl;
}

void test_text_exporter() {
    std::cout << "Testing Prometheus text export..." << std::endl;

    auto registry = std::make_shared<prometheus::Registry>();
    MetricRegistry metrics(registry);
    metrics.get_or_create("orders")->published().Increment();

    std::ostringstream out;
    TextMetricExporter exporter(out);
    exporter.export_metrics(registry->Collect());

    std::string text = out.str();
    assert(text.find("messaging_published_total") != std::string::npos);
    assert(text.find("destination=\"orders\"") != std::string::npos);

    std::cout << "✓ Text export test passed" << std::endl;
}

void test_periodic_reader() {
    std::cout << "Testing periodic metric reader..." << std::endl;

    std::ostringstream log_out;
    Logger logger("test", LogLevel::error);
    logger.set_streams(&log_out, &log_out);

    auto registry = std::make_shared<prometheus::Registry>();
    MetricRegistry metrics(registry);
    metrics.get_or_create("orders")->consumed().Increment();

    auto exporter = std::make_shared<InMemoryMetricExporter>();
    PeriodicMetricReader reader(registry, exporter, std::chrono::milliseconds(20), logger);
    reader.start();
    assert(reader.running());

    for (int i = 0; i < 100 && exporter->export_count() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(exporter->export_count() >= 2);

    size_t before_stop = exporter->export_count();
    reader.stop();
    assert(!reader.running());
    assert(exporter->export_count() >= before_stop + 1);
    assert(counter_value(exporter->last_snapshot(), "messaging_consumed_total", "orders") == 1);

    std::cout << "✓ Periodic reader test passed" << std::endl;
}

void test_reader_rejects_invalid_interval() {
    std::cout << "Testing reader interval validation..." << std::endl;

    Logger logger("test", LogLevel::error);
    bool threw = false;
    try {
        PeriodicMetricReader reader(std::make_shared<prometheus::Registry>(),
                                    std::make_shared<InMemoryMetricExporter>(),
                                    std::chrono::milliseconds(0), logger);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "✓ Interval validation test passed" << std::endl;
}

int main() {
    std::cout << "=== Metric Registry Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_same_destination_same_instance();
        test_concurrent_first_access();
        test_destination_label_exported();
        test_histograms_record();
        test_http_instruments_per_method();

        std::cout << std::endl;
        std::cout << "=== Metric Export Tests ===" << std::endl;
        std::cout << std::endl;

        test_text_exporter();
        test_periodic_reader();
        test_reader_rejects_invalid_interval();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
