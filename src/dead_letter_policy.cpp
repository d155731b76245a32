#include "tracehop/telemetry/dead_letter_policy.hpp"
#include <stdexcept>

namespace tracehop {
namespace telemetry {

const QueueDeclaration* RetryTopology::find_queue(const std::string& name) const {
    for (const auto& queue : queues_) {
        if (queue.name == name) {
            return &queue;
        }
    }
    return nullptr;
}

const char* to_string(DeliveryState state) {
    switch (state) {
        case DeliveryState::ready:
            return "READY";
        case DeliveryState::delayed:
            return "DELAYED";
        case DeliveryState::dead_lettered:
            return "DEAD_LETTERED";
    }
    return "READY";
}

RetryTopology DeadLetterPolicy::build(const std::string& queue, const Config& config) {
    if (queue.empty()) {
        throw std::invalid_argument("queue name must not be empty");
    }
    if (config.delay_ms < 0) {
        throw std::invalid_argument("delay_ms must not be negative");
    }
    if (config.max_retries < 1) {
        throw std::invalid_argument("max_retries must be at least 1");
    }

    RetryTopology topology;
    topology.primary_queue_ = queue;
    topology.dead_letter_exchange_ = queue + ".dlx";
    topology.delay_queue_ = queue + ".dlq";
    topology.parking_queue_ = queue + ".parking";
    topology.delay_ms_ = config.delay_ms;
    topology.max_retries_ = config.max_retries;

    topology.exchanges_.push_back(ExchangeDeclaration{topology.dead_letter_exchange_, "direct", true});

    // Delay queue: expired messages go back to the primary queue via the default exchange
    QueueDeclaration delay_queue;
    delay_queue.name = topology.delay_queue_;
    delay_queue.arguments = {
        {"x-message-ttl", config.delay_ms},
        {"x-dead-letter-exchange", ""},
        {"x-dead-letter-routing-key", queue}
    };
    topology.queues_.push_back(delay_queue);

    QueueDeclaration parking_queue;
    parking_queue.name = topology.parking_queue_;
    topology.queues_.push_back(parking_queue);

    // Primary queue: rejected messages go to the dead-letter exchange
    QueueDeclaration primary_queue;
    primary_queue.name = queue;
    primary_queue.arguments = {
        {"x-dead-letter-exchange", topology.dead_letter_exchange_},
        {"x-dead-letter-routing-key", queue}
    };
    topology.queues_.push_back(primary_queue);

    topology.bindings_.push_back(Binding{topology.delay_queue_, topology.dead_letter_exchange_, queue});
    topology.bindings_.push_back(Binding{topology.parking_queue_, topology.dead_letter_exchange_, topology.parking_queue_});

    return topology;
}

void DeadLetterPolicy::declare(const RetryTopology& topology, TopologyDeclarer& declarer) {
    for (const auto& exchange : topology.exchanges()) {
        declarer.declare_exchange(exchange);
    }
    for (const auto& queue : topology.queues()) {
        declarer.declare_queue(queue);
    }
    for (const auto& binding : topology.bindings()) {
        declarer.bind_queue(binding);
    }
}

DeliveryState next_state_after_failure(const RetryTopology& topology, int32_t failures) {
    if (failures <= 0) {
        return DeliveryState::ready;
    }
    if (failures > topology.max_retries()) {
        return DeliveryState::dead_lettered;
    }
    return DeliveryState::delayed;
}

std::string dead_letter_routing_key(const RetryTopology& topology, int32_t failures) {
    if (next_state_after_failure(topology, failures) == DeliveryState::dead_lettered) {
        return topology.parking_queue();
    }
    return topology.primary_queue();
}

} // namespace telemetry
} // namespace tracehop
