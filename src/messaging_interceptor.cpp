#include "tracehop/telemetry/messaging_interceptor.hpp"
#include "tracehop/telemetry/context_codec.hpp"
#include "tracehop/telemetry/context_scope.hpp"

namespace tracehop {
namespace telemetry {

RedeliveryPredicate header_presence_marker(const std::string& header_name) {
    return [header_name](const Headers& headers) {
        return headers.find(header_name) != headers.end();
    };
}

MessagingInterceptor::MessagingInterceptor(SpanRecorder& recorder,
                                           MetricRegistry& metrics,
                                           Logger& logger,
                                           MessagingOptions options)
    : recorder_(recorder),
      metrics_(metrics),
      logger_(logger),
      options_(std::move(options)) {}

PublishFn MessagingInterceptor::wrap_publish(PublishFn publish) {
    return [this, publish = std::move(publish)](const MessageEnvelope& envelope) {
        publish_instrumented(publish, envelope);
    };
}

ConsumeFn MessagingInterceptor::wrap_consumer(const std::string& queue, ConsumeFn callback) {
    return [this, queue, callback = std::move(callback)](const Delivery& delivery) {
        consume_instrumented(queue, callback, delivery);
    };
}

Attributes MessagingInterceptor::base_attributes(const std::string& destination,
                                                 const MessageEnvelope& message) const {
    Attributes attributes = {
        {"messaging.system", options_.system},
        {"messaging.destination", destination},
        {"messaging.destination_kind", "queue"},
        {"messaging.protocol", options_.protocol},
        {"messaging.message_payload_size_bytes", static_cast<int64_t>(message.body.size())}
    };
    if (!message.message_id.empty()) {
        attributes["messaging.message_id"] = message.message_id;
    }
    if (!message.correlation_id.empty()) {
        attributes["messaging.correlation_id"] = message.correlation_id;
    }
    return attributes;
}

void MessagingInterceptor::publish_instrumented(const PublishFn& publish, const MessageEnvelope& envelope) {
    MessageEnvelope message = envelope;

    Attributes attributes = base_attributes(message.routing_key, message);
    if (!message.exchange.empty()) {
        attributes["messaging.rabbitmq.exchange"] = message.exchange;
    }

    SpanScope scope(recorder_,
                    recorder_.start_span("publish " + message.routing_key, SpanKind::producer,
                                         std::move(attributes), current_context()));

    inject(scope.context(), current_baggage(), message.headers);

    if (message.correlation_id.empty()) {
        message.correlation_id = scope.context().span_id_hex();
        scope.span().set_attribute("messaging.correlation_id", message.correlation_id);
    }

    traced_call(scope, [&]() { publish(message); });

    record_published(message.routing_key, message);
    scope.end(StatusCode::ok);
}

void MessagingInterceptor::consume_instrumented(const std::string& queue,
                                                const ConsumeFn& callback,
                                                const Delivery& delivery) {
    const MessageEnvelope& message = delivery.message;

    ExtractedContext extracted = extract(message.headers);
    std::optional<TraceContext> parent;
    if (extracted.context.is_valid()) {
        parent = extracted.context;
    } else {
        logger_.log_debug("No trace context in message headers, starting new trace", {
            {"queue", queue},
            {"message_id", message.message_id}
        });
    }

    Attributes attributes = base_attributes(queue, message);
    attributes["messaging.operation"] = "receive";
    attributes["messaging.rabbitmq.delivery_tag"] = static_cast<int64_t>(delivery.delivery_tag);
    if (delivery.redelivered) {
        attributes["messaging.rabbitmq.redelivered"] = true;
    }

    SpanScope consume_scope(recorder_,
                            recorder_.start_span("consume " + queue, SpanKind::consumer,
                                                 std::move(attributes), parent),
                            extracted.baggage);

    bool is_retry = false;
    if (options_.is_redelivery) {
        is_retry = options_.is_redelivery(message.headers);
    }
    if (is_retry) {
        consume_scope.span().set_attribute("messaging.retry", true);
    }
    record_consumed(queue, message, is_retry);

    auto started = std::chrono::steady_clock::now();
    try {
        SpanScope process_scope(recorder_,
                                recorder_.start_span("process " + queue, SpanKind::internal,
                                                     {{"messaging.operation", "process"}},
                                                     consume_scope.context()),
                                extracted.baggage);
        traced_call(process_scope, [&]() { callback(delivery); });
    } catch (const std::exception& e) {
        record_processing_time(queue, started);
        consume_scope.fail(describe_exception(e));
        throw;
    } catch (...) {
        record_processing_time(queue, started);
        consume_scope.fail(describe_unknown_exception());
        throw;
    }

    record_processing_time(queue, started);
    consume_scope.end(StatusCode::ok);
}

void MessagingInterceptor::record_published(const std::string& routing_key, const MessageEnvelope& message) {
    try {
        auto instruments = metrics_.get_or_create(routing_key);
        instruments->published().Increment();
        instruments->message_size().Observe(static_cast<double>(message.body.size()));
    } catch (const std::exception& e) {
        logger_.log_warn("Failed to record publish metrics", {
            {"routing_key", routing_key},
            {"error", e.what()}
        });
    }
}

void MessagingInterceptor::record_consumed(const std::string& queue, const MessageEnvelope& message, bool is_retry) {
    try {
        auto instruments = metrics_.get_or_create(queue);
        instruments->consumed().Increment();
        instruments->message_size().Observe(static_cast<double>(message.body.size()));
        if (is_retry) {
            instruments->retries().Increment();
        }
        if (message.timestamp) {
            auto queued_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now() - *message.timestamp).count();
            if (queued_ms >= 0) {
                instruments->queue_time().Observe(static_cast<double>(queued_ms));
            }
        }
    } catch (const std::exception& e) {
        logger_.log_warn("Failed to record consume metrics", {
            {"queue", queue},
            {"error", e.what()}
        });
    }
}

void MessagingInterceptor::record_processing_time(const std::string& queue,
                                                  std::chrono::steady_clock::time_point started) {
    try {
        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
        metrics_.get_or_create(queue)->processing_time().Observe(elapsed.count());
    } catch (const std::exception& e) {
        logger_.log_warn("Failed to record processing time", {
            {"queue", queue},
            {"error", e.what()}
        });
    }
}

} // namespace telemetry
} // namespace tracehop
