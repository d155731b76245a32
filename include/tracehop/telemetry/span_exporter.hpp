#pragma once

#include "tracehop/telemetry/core.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <iosfwd>
#include <mutex>
#include <vector>

namespace tracehop {
namespace telemetry {

enum class ExportResult {
    success,
    failure
};

/**
 * Sink for finished spans.
 *
 * export_batch() is called from the recorder's worker thread only. The
 * receiving side must tolerate duplicate and out-of-order batches since a
 * failed batch is retried as a whole.
 */
class SpanExporter {
public:
    virtual ~SpanExporter() = default;

    virtual ExportResult export_batch(const std::vector<SpanData>& spans) = 0;
    virtual bool is_healthy() { return true; }
    virtual void shutdown() {}
};

// Flat JSON view of one span (used by the ostream exporter and logs)
nlohmann::json span_to_json(const SpanData& span);

// Keeps every exported span in memory. Used by tests.
class InMemorySpanExporter : public SpanExporter {
public:
    ExportResult export_batch(const std::vector<SpanData>& spans) override;

    std::vector<SpanData> finished_spans() const;
    size_t batch_count() const;
    void reset();

    // Makes the next `count` calls fail (exercises requeue/drop)
    void fail_next(size_t count);

private:
    mutable std::mutex mutex_;
    std::vector<SpanData> spans_;
    size_t batches_ = 0;
    size_t failures_pending_ = 0;
};

// Writes one JSON line per span
class OStreamSpanExporter : public SpanExporter {
public:
    explicit OStreamSpanExporter(std::ostream& out) : out_(out) {}

    ExportResult export_batch(const std::vector<SpanData>& spans) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace telemetry
} // namespace tracehop
