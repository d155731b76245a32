#include "tracehop/telemetry/metric_registry.hpp"
#include <mutex>
#include <stdexcept>

namespace tracehop {
namespace telemetry {

InstrumentSet::InstrumentSet(const std::string& destination,
                             prometheus::Family<prometheus::Counter>& published_family,
                             prometheus::Family<prometheus::Counter>& consumed_family,
                             prometheus::Family<prometheus::Histogram>& message_size_family,
                             prometheus::Family<prometheus::Histogram>& processing_time_family,
                             prometheus::Family<prometheus::Histogram>& queue_time_family,
                             prometheus::Family<prometheus::Counter>& retries_family)
    : destination_(destination),
      published_(published_family.Add({{"destination", destination}})),
      consumed_(consumed_family.Add({{"destination", destination}})),
      message_size_(message_size_family.Add({{"destination", destination}}, MetricRegistry::size_buckets())),
      processing_time_(processing_time_family.Add({{"destination", destination}}, MetricRegistry::latency_buckets())),
      queue_time_(queue_time_family.Add({{"destination", destination}}, MetricRegistry::latency_buckets())),
      retries_(retries_family.Add({{"destination", destination}})) {}

HttpInstrumentSet::HttpInstrumentSet(const std::string& destination,
                                     prometheus::Family<prometheus::Histogram>& request_duration_family,
                                     prometheus::Family<prometheus::Counter>& errors_family)
    : destination_(destination),
      request_duration_family_(request_duration_family),
      errors_family_(errors_family) {}

prometheus::Histogram& HttpInstrumentSet::request_duration(const std::string& method) {
    return request_duration_family_.Add({{"destination", destination_}, {"method", method}},
                                        MetricRegistry::latency_buckets());
}

prometheus::Counter& HttpInstrumentSet::errors(const std::string& error_kind) {
    return errors_family_.Add({{"destination", destination_}, {"error_kind", error_kind}});
}

MetricRegistry::MetricRegistry(std::shared_ptr<prometheus::Registry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("MetricRegistry requires a prometheus registry");
    }

    published_family_ = &prometheus::BuildCounter()
        .Name("messaging_published_total")
        .Help("Messages published, by routing key")
        .Register(*registry_);

    consumed_family_ = &prometheus::BuildCounter()
        .Name("messaging_consumed_total")
        .Help("Messages delivered to consumers, by queue")
        .Register(*registry_);

    message_size_family_ = &prometheus::BuildHistogram()
        .Name("messaging_message_size_bytes")
        .Help("Message body size in bytes")
        .Register(*registry_);

    processing_time_family_ = &prometheus::BuildHistogram()
        .Name("messaging_processing_time_ms")
        .Help("Consumer callback duration in milliseconds")
        .Register(*registry_);

    queue_time_family_ = &prometheus::BuildHistogram()
        .Name("messaging_queue_time_ms")
        .Help("Time between publish timestamp and delivery in milliseconds")
        .Register(*registry_);

    retries_family_ = &prometheus::BuildCounter()
        .Name("messaging_retries_total")
        .Help("Deliveries that came back through the retry path")
        .Register(*registry_);

    request_duration_family_ = &prometheus::BuildHistogram()
        .Name("http_request_duration_ms")
        .Help("HTTP request duration in milliseconds")
        .Register(*registry_);

    errors_family_ = &prometheus::BuildCounter()
        .Name("http_errors_total")
        .Help("Failed HTTP requests by error kind")
        .Register(*registry_);
}

std::shared_ptr<InstrumentSet> MetricRegistry::get_or_create(const std::string& destination) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = sets_.find(destination);
        if (it != sets_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sets_.find(destination);
    if (it != sets_.end()) {
        return it->second;
    }
    auto set = std::make_shared<InstrumentSet>(destination,
                                               *published_family_,
                                               *consumed_family_,
                                               *message_size_family_,
                                               *processing_time_family_,
                                               *queue_time_family_,
                                               *retries_family_);
    sets_.emplace(destination, set);
    return set;
}

std::shared_ptr<HttpInstrumentSet> MetricRegistry::get_or_create_http(const std::string& destination) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = http_sets_.find(destination);
        if (it != http_sets_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = http_sets_.find(destination);
    if (it != http_sets_.end()) {
        return it->second;
    }
    auto set = std::make_shared<HttpInstrumentSet>(destination, *request_duration_family_, *errors_family_);
    http_sets_.emplace(destination, set);
    return set;
}

size_t MetricRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sets_.size();
}

size_t MetricRegistry::http_size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return http_sets_.size();
}

const prometheus::Histogram::BucketBoundaries& MetricRegistry::size_buckets() {
    static const prometheus::Histogram::BucketBoundaries buckets = {
        64, 256, 1024, 4096, 16384, 65536, 262144, 1048576
    };
    return buckets;
}

const prometheus::Histogram::BucketBoundaries& MetricRegistry::latency_buckets() {
    static const prometheus::Histogram::BucketBoundaries buckets = {
        1, 5, 10, 25, 50, 100, 200, 500, 1000, 2000, 5000
    };
    return buckets;
}

} // namespace telemetry
} // namespace tracehop
