#pragma once

#include "tracehop/telemetry/core.hpp"
#include "tracehop/telemetry/logger.hpp"
#include "tracehop/telemetry/metric_registry.hpp"
#include "tracehop/telemetry/span_recorder.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tracehop {
namespace telemetry {

// Broker message as seen by the publisher / consumer
struct MessageEnvelope {
    std::string exchange;
    std::string routing_key;
    std::string body;
    Headers headers;
    std::string message_id;
    std::string correlation_id;
    std::optional<std::chrono::system_clock::time_point> timestamp;
};

struct Delivery {
    MessageEnvelope message;
    uint64_t delivery_tag = 0;
    bool redelivered = false;
};

using PublishFn = std::function<void(const MessageEnvelope&)>;
using ConsumeFn = std::function<void(const Delivery&)>;

// True when the headers show the message came back through the retry path
using RedeliveryPredicate = std::function<bool(const Headers&)>;

// Predicate matching on the presence of one header
RedeliveryPredicate header_presence_marker(const std::string& header_name);

struct MessagingOptions {
    std::string system = "rabbitmq";
    std::string protocol = "AMQP";
    RedeliveryPredicate is_redelivery = header_presence_marker("x-first-death-exchange");
};

/**
 * Wraps broker publish calls and consumer callbacks with spans, context
 * propagation and per-destination metrics.
 *
 * The wrapped operation's outcome is never changed: results pass through
 * and exceptions are rethrown unchanged after being recorded. The
 * interceptor never acks or nacks; the broker decides what happens to a
 * failed delivery.
 *
 * Wrappers keep a reference to the interceptor, which must outlive them.
 */
class MessagingInterceptor {
public:
    MessagingInterceptor(SpanRecorder& recorder,
                         MetricRegistry& metrics,
                         Logger& logger,
                         MessagingOptions options = MessagingOptions());

    PublishFn wrap_publish(PublishFn publish);
    ConsumeFn wrap_consumer(const std::string& queue, ConsumeFn callback);

private:
    void publish_instrumented(const PublishFn& publish, const MessageEnvelope& envelope);
    void consume_instrumented(const std::string& queue, const ConsumeFn& callback, const Delivery& delivery);

    Attributes base_attributes(const std::string& destination, const MessageEnvelope& message) const;

    void record_published(const std::string& routing_key, const MessageEnvelope& message);
    void record_consumed(const std::string& queue, const MessageEnvelope& message, bool is_retry);
    void record_processing_time(const std::string& queue, std::chrono::steady_clock::time_point started);

    SpanRecorder& recorder_;
    MetricRegistry& metrics_;
    Logger& logger_;
    MessagingOptions options_;
};

} // namespace telemetry
} // namespace tracehop
