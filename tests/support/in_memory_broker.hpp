#pragma once

#include "tracehop/telemetry/dead_letter_policy.hpp"
#include "tracehop/telemetry/messaging_interceptor.hpp"
#include <deque>
#include <exception>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace tracehop {
namespace telemetry {
namespace testing {

/**
 * Single-threaded broker double for one retry topology.
 *
 * A delivery whose consumer throws is dead-lettered the way the broker
 * would: through the dead-letter exchange with the routing key chosen by
 * dead_letter_routing_key(), stamped with x-first-death-* headers. Delay
 * queue TTL expiry is driven explicitly by expire_delayed().
 */
class InMemoryBroker : public TopologyDeclarer {
public:
    void declare_exchange(const ExchangeDeclaration& exchange) override {
        exchanges_.push_back(exchange.name);
    }

    void declare_queue(const QueueDeclaration& queue) override {
        queues_[queue.name];
    }

    void bind_queue(const Binding& binding) override {
        if (queues_.find(binding.queue) == queues_.end()) {
            throw std::runtime_error("bind to undeclared queue: " + binding.queue);
        }
        bindings_.push_back(binding);
    }

    void apply(const RetryTopology& topology) {
        DeadLetterPolicy::declare(topology, *this);
        topology_ = &topology;
    }

    void publish(const std::string& queue, MessageEnvelope message) {
        auto it = queues_.find(queue);
        if (it == queues_.end()) {
            throw std::runtime_error("unknown queue: " + queue);
        }
        it->second.push_back(Entry{std::move(message), 0});
    }

    // Delivers the head of `queue`. Returns false when the queue is empty.
    bool deliver_next(const std::string& queue, const ConsumeFn& consumer) {
        auto& pending = queues_.at(queue);
        if (pending.empty()) {
            return false;
        }
        Entry entry = std::move(pending.front());
        pending.pop_front();

        Delivery delivery;
        delivery.message = entry.message;
        delivery.delivery_tag = ++delivery_tag_;
        try {
            consumer(delivery);
        } catch (const std::exception&) {
            dead_letter(queue, std::move(entry));
        }
        return true;
    }

    // Delay queue TTL elapsed: move everything back to the primary queue
    void expire_delayed() {
        auto& delayed = queues_.at(topology_->delay_queue());
        auto& primary = queues_.at(topology_->primary_queue());
        while (!delayed.empty()) {
            primary.push_back(std::move(delayed.front()));
            delayed.pop_front();
        }
    }

    size_t depth(const std::string& queue) const {
        auto it = queues_.find(queue);
        return it == queues_.end() ? 0 : it->second.size();
    }

    const std::vector<std::string>& exchanges() const { return exchanges_; }
    const std::vector<Binding>& bindings() const { return bindings_; }

private:
    struct Entry {
        MessageEnvelope message;
        int32_t failures;
    };

    void dead_letter(const std::string& queue, Entry entry) {
        entry.failures++;
        std::string routing_key = dead_letter_routing_key(*topology_, entry.failures);

        if (entry.message.headers.find("x-first-death-exchange") == entry.message.headers.end()) {
            entry.message.headers["x-first-death-exchange"] = topology_->dead_letter_exchange();
            entry.message.headers["x-first-death-queue"] = queue;
            entry.message.headers["x-first-death-reason"] = "rejected";
        }

        for (const auto& binding : bindings_) {
            if (binding.exchange == topology_->dead_letter_exchange() && binding.routing_key == routing_key) {
                queues_.at(binding.queue).push_back(std::move(entry));
                return;
            }
        }
        throw std::runtime_error("unroutable dead-letter key: " + routing_key);
    }

    const RetryTopology* topology_ = nullptr;
    std::vector<std::string> exchanges_;
    std::map<std::string, std::deque<Entry>> queues_;
    std::vector<Binding> bindings_;
    uint64_t delivery_tag_ = 0;
};

} // namespace testing
} // namespace telemetry
} // namespace tracehop
