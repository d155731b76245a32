#pragma once

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace tracehop {
namespace telemetry {

/**
 * Messaging instruments of one destination (routing key or queue name).
 * Every instrument carries the `destination` label.
 */
class InstrumentSet {
public:
    InstrumentSet(const std::string& destination,
                  prometheus::Family<prometheus::Counter>& published_family,
                  prometheus::Family<prometheus::Counter>& consumed_family,
                  prometheus::Family<prometheus::Histogram>& message_size_family,
                  prometheus::Family<prometheus::Histogram>& processing_time_family,
                  prometheus::Family<prometheus::Histogram>& queue_time_family,
                  prometheus::Family<prometheus::Counter>& retries_family);

    const std::string& destination() const { return destination_; }

    prometheus::Counter& published() { return published_; }
    prometheus::Counter& consumed() { return consumed_; }
    prometheus::Histogram& message_size() { return message_size_; }
    prometheus::Histogram& processing_time() { return processing_time_; }
    prometheus::Histogram& queue_time() { return queue_time_; }
    prometheus::Counter& retries() { return retries_; }

private:
    std::string destination_;
    prometheus::Counter& published_;
    prometheus::Counter& consumed_;
    prometheus::Histogram& message_size_;
    prometheus::Histogram& processing_time_;
    prometheus::Histogram& queue_time_;
    prometheus::Counter& retries_;
};

// HTTP instruments of one destination (URL without query, or server route).
class HttpInstrumentSet {
public:
    HttpInstrumentSet(const std::string& destination,
                      prometheus::Family<prometheus::Histogram>& request_duration_family,
                      prometheus::Family<prometheus::Counter>& errors_family);

    const std::string& destination() const { return destination_; }

    // One more label per call; Family::Add returns the same instance for
    // the same label set.
    prometheus::Histogram& request_duration(const std::string& method);
    prometheus::Counter& errors(const std::string& error_kind);

private:
    std::string destination_;
    prometheus::Family<prometheus::Histogram>& request_duration_family_;
    prometheus::Family<prometheus::Counter>& errors_family_;
};

/**
 * Keyed registry of InstrumentSets and HttpInstrumentSets.
 *
 * get_or_create() and get_or_create_http() return the same set for the same
 * destination for the lifetime of the registry, including under concurrent
 * first access. The two keyspaces are separate, so HTTP destinations never
 * create messaging series.
 */
class MetricRegistry {
public:
    explicit MetricRegistry(std::shared_ptr<prometheus::Registry> registry);

    std::shared_ptr<InstrumentSet> get_or_create(const std::string& destination);
    std::shared_ptr<HttpInstrumentSet> get_or_create_http(const std::string& destination);

    size_t size() const;
    size_t http_size() const;

    std::shared_ptr<prometheus::Registry> registry() const { return registry_; }

    static const prometheus::Histogram::BucketBoundaries& size_buckets();
    static const prometheus::Histogram::BucketBoundaries& latency_buckets();

private:
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* published_family_;
    prometheus::Family<prometheus::Counter>* consumed_family_;
    prometheus::Family<prometheus::Histogram>* message_size_family_;
    prometheus::Family<prometheus::Histogram>* processing_time_family_;
    prometheus::Family<prometheus::Histogram>* queue_time_family_;
    prometheus::Family<prometheus::Counter>* retries_family_;
    prometheus::Family<prometheus::Histogram>* request_duration_family_;
    prometheus::Family<prometheus::Counter>* errors_family_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<InstrumentSet>> sets_;
    std::unordered_map<std::string, std::shared_ptr<HttpInstrumentSet>> http_sets_;
};

} // namespace telemetry
} // namespace tracehop
