#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tracehop {
namespace telemetry {

// Flat key/value transport for context (HTTP headers or message headers)
using Headers = std::map<std::string, std::string>;

// Span attributes hold scalars only (string, integer, double, bool)
using AttributeValue = nlohmann::json;
using Attributes = std::map<std::string, AttributeValue>;

using TraceId = std::array<uint8_t, 16>;
using SpanId = std::array<uint8_t, 8>;

std::string to_hex(const uint8_t* data, size_t size);

// Identifying triple of a span. Immutable once created; a new one is derived
// for every child span.
class TraceContext {
public:
    TraceContext() = default;
    TraceContext(const TraceId& trace_id, const SpanId& span_id, bool sampled)
        : trace_id_(trace_id), span_id_(span_id), sampled_(sampled) {}

    const TraceId& trace_id() const { return trace_id_; }
    const SpanId& span_id() const { return span_id_; }
    bool sampled() const { return sampled_; }

    // All-zero ids mark "no parent"
    bool is_valid() const;

    std::string trace_id_hex() const { return to_hex(trace_id_.data(), trace_id_.size()); }
    std::string span_id_hex() const { return to_hex(span_id_.data(), span_id_.size()); }

    bool operator==(const TraceContext& other) const {
        return trace_id_ == other.trace_id_ && span_id_ == other.span_id_ && sampled_ == other.sampled_;
    }
    bool operator!=(const TraceContext& other) const { return !(*this == other); }

private:
    TraceId trace_id_{};
    SpanId span_id_{};
    bool sampled_ = false;
};

/**
 * Key/value metadata propagated next to the trace context.
 *
 * Snapshots are immutable: set() and remove() return a new Baggage and leave
 * every existing copy untouched.
 */
class Baggage {
public:
    Baggage();

    std::optional<std::string> get(const std::string& key) const;
    Baggage set(const std::string& key, const std::string& value) const;
    Baggage remove(const std::string& key) const;

    const std::map<std::string, std::string>& entries() const { return *entries_; }
    bool empty() const { return entries_->empty(); }
    size_t size() const { return entries_->size(); }

    bool operator==(const Baggage& other) const { return *entries_ == *other.entries_; }
    bool operator!=(const Baggage& other) const { return !(*this == other); }

private:
    explicit Baggage(std::shared_ptr<const std::map<std::string, std::string>> entries)
        : entries_(std::move(entries)) {}

    std::shared_ptr<const std::map<std::string, std::string>> entries_;
};

enum class SpanKind {
    internal,
    client,
    server,
    producer,
    consumer
};

enum class StatusCode {
    unset,
    ok,
    error
};

const char* to_string(SpanKind kind);
const char* to_string(StatusCode status);

struct ExceptionInfo {
    std::string type;
    std::string message;
};

// Finished (or in-flight) span record handed to exporters
struct SpanData {
    std::string name;
    SpanKind kind = SpanKind::internal;
    TraceContext context;
    std::optional<TraceContext> parent;
    Attributes attributes;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    StatusCode status = StatusCode::unset;
    std::string status_message;
    std::optional<ExceptionInfo> exception;

    int64_t duration_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    }
};

// Describes an in-flight exception for span recording (demangled type name)
ExceptionInfo describe_exception(const std::exception& e);
ExceptionInfo describe_unknown_exception();

} // namespace telemetry
} // namespace tracehop
