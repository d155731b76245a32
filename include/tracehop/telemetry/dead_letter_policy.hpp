#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tracehop {
namespace telemetry {

// Broker declaration arguments ("x-message-ttl", "x-dead-letter-exchange", ...)
using Arguments = std::map<std::string, nlohmann::json>;

struct ExchangeDeclaration {
    std::string name;
    std::string type = "direct";
    bool durable = true;
};

struct QueueDeclaration {
    std::string name;
    Arguments arguments;
    bool durable = true;
};

struct Binding {
    std::string queue;
    std::string exchange;
    std::string routing_key;
};

/**
 * Retry topology of one work queue. Immutable after build().
 *
 *   <queue>          primary, dead-letters failures to <queue>.dlx / <queue>
 *   <queue>.dlx      direct exchange
 *   <queue>.dlq      delay queue; after delay_ms the message goes back to
 *                    <queue> through the default exchange
 *   <queue>.parking  terminal queue for messages past max_retries
 */
class RetryTopology {
public:
    const std::string& primary_queue() const { return primary_queue_; }
    const std::string& delay_queue() const { return delay_queue_; }
    const std::string& dead_letter_exchange() const { return dead_letter_exchange_; }
    const std::string& parking_queue() const { return parking_queue_; }
    int64_t delay_ms() const { return delay_ms_; }
    int32_t max_retries() const { return max_retries_; }

    const std::vector<ExchangeDeclaration>& exchanges() const { return exchanges_; }
    const std::vector<QueueDeclaration>& queues() const { return queues_; }
    const std::vector<Binding>& bindings() const { return bindings_; }

    // nullptr when the queue is not part of the topology
    const QueueDeclaration* find_queue(const std::string& name) const;

private:
    friend class DeadLetterPolicy;
    RetryTopology() = default;

    std::string primary_queue_;
    std::string delay_queue_;
    std::string dead_letter_exchange_;
    std::string parking_queue_;
    int64_t delay_ms_ = 0;
    int32_t max_retries_ = 0;

    std::vector<ExchangeDeclaration> exchanges_;
    std::vector<QueueDeclaration> queues_;
    std::vector<Binding> bindings_;
};

// Broker side of topology declaration (AMQP channel adapter, test double)
class TopologyDeclarer {
public:
    virtual ~TopologyDeclarer() = default;

    virtual void declare_exchange(const ExchangeDeclaration& exchange) = 0;
    virtual void declare_queue(const QueueDeclaration& queue) = 0;
    virtual void bind_queue(const Binding& binding) = 0;
};

enum class DeliveryState {
    ready,
    delayed,
    dead_lettered
};

const char* to_string(DeliveryState state);

class DeadLetterPolicy {
public:
    struct Config {
        Config() {}
        int64_t delay_ms = 30000;    // Time spent in the delay queue
        int32_t max_retries = 3;     // Failures before a message is parked
    };

    // Throws std::invalid_argument on an empty queue name, a negative delay
    // or max_retries < 1.
    static RetryTopology build(const std::string& queue, const Config& config = Config());

    // Exchanges first, then queues, then bindings. Broker errors propagate.
    static void declare(const RetryTopology& topology, TopologyDeclarer& declarer);
};

// State of a message after its `failures`-th failed processing attempt
DeliveryState next_state_after_failure(const RetryTopology& topology, int32_t failures);

// Key a broker adapter uses to dead-letter the `failures`-th failure into
// the dead-letter exchange: the primary queue name while retries remain,
// the parking queue name after that.
std::string dead_letter_routing_key(const RetryTopology& topology, int32_t failures);

} // namespace telemetry
} // namespace tracehop
