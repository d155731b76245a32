#pragma once

#include "tracehop/telemetry/config.hpp"
#include "tracehop/telemetry/context_scope.hpp"
#include "tracehop/telemetry/core.hpp"
#include "tracehop/telemetry/export_retry_policy.hpp"
#include "tracehop/telemetry/logger.hpp"
#include "tracehop/telemetry/sampler.hpp"
#include "tracehop/telemetry/span_exporter.hpp"
#include <prometheus/counter.h>
#include <prometheus/registry.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tracehop {
namespace telemetry {

class SpanRecorder;

/**
 * A live span. Move-only; exactly one owner ends it.
 *
 * Mutations after end are ignored. A moved-from Span behaves as ended.
 */
class Span {
public:
    Span(Span&& other) noexcept;
    Span& operator=(Span&& other) noexcept;
    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    const TraceContext& context() const { return data_.context; }
    const std::string& name() const { return data_.name; }
    SpanKind kind() const { return data_.kind; }
    const Attributes& attributes() const { return data_.attributes; }

    void set_attribute(const std::string& key, AttributeValue value);
    void record_exception(const ExceptionInfo& exception);
    void set_status(StatusCode status, const std::string& message = "");

    bool ended() const { return ended_; }
    bool is_recording() const { return !ended_ && data_.context.sampled(); }

private:
    friend class SpanRecorder;
    explicit Span(SpanData data) : data_(std::move(data)) {}

    SpanData data_;
    bool ended_ = false;
};

struct RecorderOptions {
    size_t max_queue_size = 2048;
    size_t max_export_batch_size = 512;
    std::chrono::milliseconds schedule_delay{5000};
    ExportRetryPolicy::Config retry;

    static RecorderOptions from_config(const TelemetryConfig& config);
};

/**
 * Creates spans and ships finished ones to a SpanExporter.
 *
 * start_span()/end_span() only touch memory; export runs on one worker
 * thread that sends batches of at most max_export_batch_size when the
 * buffer fills, when schedule_delay elapses, on force_flush() and on
 * shutdown(). A failed batch is requeued with exponential backoff until
 * max_attempts, then dropped and counted.
 */
class SpanRecorder {
public:
    SpanRecorder(std::shared_ptr<SpanExporter> exporter,
                 RatioSampler sampler,
                 RecorderOptions options,
                 Logger& logger,
                 std::shared_ptr<prometheus::Registry> registry = nullptr);
    ~SpanRecorder();

    SpanRecorder(const SpanRecorder&) = delete;
    SpanRecorder& operator=(const SpanRecorder&) = delete;

    // Continues the trace of a valid, sampled parent. An absent, invalid or
    // unsampled parent starts a new trace and the sampler decides.
    Span start_span(const std::string& name,
                    SpanKind kind,
                    Attributes attributes = {},
                    const std::optional<TraceContext>& parent = std::nullopt);

    // Terminal. Second and later calls are no-ops. Never throws.
    void end_span(Span& span, StatusCode status = StatusCode::ok,
                  const std::optional<ExceptionInfo>& exception = std::nullopt) noexcept;

    // Exports everything buffered, retrying failed batches without waiting
    // for backoff. Returns false on timeout.
    bool force_flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    // Flushes and stops the worker. Idempotent.
    void shutdown();

    uint64_t dropped_spans() const { return dropped_.load(); }
    uint64_t exported_spans() const { return exported_.load(); }
    size_t buffered_spans() const;

    SpanExporter& exporter() { return *exporter_; }

private:
    struct PendingBatch {
        std::vector<SpanData> spans;
        int32_t failed_attempts = 0;
        std::chrono::steady_clock::time_point not_before;
    };

    void worker_loop();
    bool export_once(const PendingBatch& batch);
    void record_drop(size_t count, const std::string& reason);

    std::shared_ptr<SpanExporter> exporter_;
    RatioSampler sampler_;
    IdGenerator ids_;
    RecorderOptions options_;
    ExportRetryPolicy retry_policy_;
    Logger& logger_;

    prometheus::Counter* dropped_counter_ = nullptr;
    prometheus::Counter* exported_counter_ = nullptr;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<SpanData> buffer_;
    std::deque<PendingBatch> retry_queue_;
    size_t in_flight_ = 0;
    bool flush_requested_ = false;
    bool stop_ = false;
    bool stopped_ = false;

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> exported_{0};

    std::thread worker_;
};

/**
 * Scoped span: the span's context (and baggage) is current on this thread
 * for the lifetime of the scope, and the span is ended on every exit path.
 *
 * If neither end() nor fail() was called, the destructor ends the span with
 * ERROR while an exception is unwinding and OK otherwise.
 */
class SpanScope {
public:
    SpanScope(SpanRecorder& recorder, Span span);
    SpanScope(SpanRecorder& recorder, Span span, const Baggage& baggage);
    ~SpanScope();

    SpanScope(const SpanScope&) = delete;
    SpanScope& operator=(const SpanScope&) = delete;

    Span& span() { return span_; }
    const TraceContext& context() const { return span_.context(); }

    void end(StatusCode status = StatusCode::ok);
    void fail(const ExceptionInfo& exception);

private:
    SpanRecorder& recorder_;
    Span span_;
    ContextScope context_scope_;
    int uncaught_at_start_;
};

// Runs fn inside the scope. An exception is recorded on the scope (span
// ended with ERROR) and rethrown unchanged.
template <typename Fn>
auto traced_call(SpanScope& scope, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::exception& e) {
        scope.fail(describe_exception(e));
        throw;
    } catch (...) {
        scope.fail(describe_unknown_exception());
        throw;
    }
}

} // namespace telemetry
} // namespace tracehop
