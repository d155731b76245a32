#include "tracehop/telemetry/span_exporter.hpp"
#include <ostream>

namespace tracehop {
namespace telemetry {

using json = nlohmann::json;

json span_to_json(const SpanData& span) {
    json out;
    out["name"] = span.name;
    out["kind"] = to_string(span.kind);
    out["trace_id"] = span.context.trace_id_hex();
    out["span_id"] = span.context.span_id_hex();
    out["sampled"] = span.context.sampled();
    if (span.parent && span.parent->is_valid()) {
        out["parent_span_id"] = span.parent->span_id_hex();
    }
    out["start_time_us"] = std::chrono::duration_cast<std::chrono::microseconds>(
        span.start_time.time_since_epoch()).count();
    out["duration_ms"] = span.duration_ms();
    out["status"] = to_string(span.status);
    if (!span.status_message.empty()) {
        out["status_message"] = span.status_message;
    }

    json attributes = json::object();
    for (const auto& [key, value] : span.attributes) {
        attributes[key] = value;
    }
    out["attributes"] = attributes;

    if (span.exception) {
        out["exception"] = {
            {"type", span.exception->type},
            {"message", span.exception->message}
        };
    }
    return out;
}

ExportResult InMemorySpanExporter::export_batch(const std::vector<SpanData>& spans) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failures_pending_ > 0) {
        --failures_pending_;
        return ExportResult::failure;
    }
    spans_.insert(spans_.end(), spans.begin(), spans.end());
    ++batches_;
    return ExportResult::success;
}

std::vector<SpanData> InMemorySpanExporter::finished_spans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
}

size_t InMemorySpanExporter::batch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
}

void InMemorySpanExporter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.clear();
    batches_ = 0;
    failures_pending_ = 0;
}

void InMemorySpanExporter::fail_next(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_pending_ = count;
}

ExportResult OStreamSpanExporter::export_batch(const std::vector<SpanData>& spans) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& span : spans) {
        out_ << span_to_json(span).dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    }
    out_.flush();
    return out_.good() ? ExportResult::success : ExportResult::failure;
}

} // namespace telemetry
} // namespace tracehop
