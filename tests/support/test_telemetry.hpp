#pragma once

#include "tracehop/telemetry/logger.hpp"
#include "tracehop/telemetry/metric_registry.hpp"
#include "tracehop/telemetry/sampler.hpp"
#include "tracehop/telemetry/span_exporter.hpp"
#include "tracehop/telemetry/span_recorder.hpp"
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace tracehop {
namespace telemetry {
namespace testing {

// Recorder + registry wired to an in-memory exporter, with log output captured
struct TestTelemetry {
    std::ostringstream log_out;
    std::ostringstream log_err;
    Logger logger;
    std::shared_ptr<prometheus::Registry> registry;
    std::shared_ptr<InMemorySpanExporter> exporter;
    std::unique_ptr<SpanRecorder> recorder;
    std::unique_ptr<MetricRegistry> metrics;

    explicit TestTelemetry(double sample_ratio = 1.0, RecorderOptions options = default_options())
        : logger("test", LogLevel::debug),
          registry(std::make_shared<prometheus::Registry>()),
          exporter(std::make_shared<InMemorySpanExporter>()) {
        logger.set_streams(&log_out, &log_err);
        recorder = std::make_unique<SpanRecorder>(exporter, RatioSampler(sample_ratio), options, logger, registry);
        metrics = std::make_unique<MetricRegistry>(registry);
    }

    static RecorderOptions default_options() {
        RecorderOptions options;
        options.max_queue_size = 1024;
        options.max_export_batch_size = 64;
        options.schedule_delay = std::chrono::milliseconds(10000);
        options.retry.base_delay_ms = 10;
        options.retry.max_delay_ms = 100;
        options.retry.max_attempts = 3;
        return options;
    }

    std::vector<SpanData> flushed_spans() {
        recorder->force_flush(std::chrono::milliseconds(5000));
        return exporter->finished_spans();
    }
};

inline const SpanData* find_span(const std::vector<SpanData>& spans, const std::string& name) {
    for (const auto& span : spans) {
        if (span.name == name) {
            return &span;
        }
    }
    return nullptr;
}

inline uint64_t histogram_count(prometheus::Histogram& histogram) {
    return histogram.Collect().histogram.sample_count;
}

inline double histogram_sum(prometheus::Histogram& histogram) {
    return histogram.Collect().histogram.sample_sum;
}

inline TraceContext make_context(uint8_t seed, bool sampled) {
    TraceId trace_id{};
    SpanId span_id{};
    for (size_t i = 0; i < trace_id.size(); ++i) {
        trace_id[i] = static_cast<uint8_t>(seed + i);
    }
    for (size_t i = 0; i < span_id.size(); ++i) {
        span_id[i] = static_cast<uint8_t>(seed + 0x40 + i);
    }
    return TraceContext(trace_id, span_id, sampled);
}

} // namespace testing
} // namespace telemetry
} // namespace tracehop
