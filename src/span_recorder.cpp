#include "tracehop/telemetry/span_recorder.hpp"
#include <algorithm>
#include <stdexcept>

namespace tracehop {
namespace telemetry {

// Span

Span::Span(Span&& other) noexcept
    : data_(std::move(other.data_)), ended_(other.ended_) {
    other.ended_ = true;
}

Span& Span::operator=(Span&& other) noexcept {
    if (this != &other) {
        data_ = std::move(other.data_);
        ended_ = other.ended_;
        other.ended_ = true;
    }
    return *this;
}

void Span::set_attribute(const std::string& key, AttributeValue value) {
    if (ended_) {
        return;
    }
    data_.attributes[key] = std::move(value);
}

void Span::record_exception(const ExceptionInfo& exception) {
    if (ended_) {
        return;
    }
    data_.exception = exception;
}

void Span::set_status(StatusCode status, const std::string& message) {
    if (ended_) {
        return;
    }
    data_.status = status;
    data_.status_message = message;
}

// RecorderOptions

RecorderOptions RecorderOptions::from_config(const TelemetryConfig& config) {
    RecorderOptions options;
    options.max_queue_size = config.max_queue_size;
    options.max_export_batch_size = config.max_export_batch_size;
    options.schedule_delay = std::chrono::milliseconds(config.schedule_delay_ms);
    options.retry.base_delay_ms = config.export_backoff_base_ms;
    options.retry.max_delay_ms = config.export_backoff_max_ms;
    options.retry.max_attempts = config.max_export_attempts;
    return options;
}

// SpanRecorder

SpanRecorder::SpanRecorder(std::shared_ptr<SpanExporter> exporter,
                           RatioSampler sampler,
                           RecorderOptions options,
                           Logger& logger,
                           std::shared_ptr<prometheus::Registry> registry)
    : exporter_(std::move(exporter)),
      sampler_(sampler),
      options_(options),
      retry_policy_(options.retry),
      logger_(logger) {
    if (!exporter_) {
        throw std::invalid_argument("SpanRecorder requires an exporter");
    }
    if (options_.max_export_batch_size == 0) {
        options_.max_export_batch_size = 1;
    }
    if (registry) {
        dropped_counter_ = &prometheus::BuildCounter()
            .Name("telemetry_spans_dropped_total")
            .Help("Finished spans dropped because the buffer was full or export kept failing")
            .Register(*registry)
            .Add({});
        exported_counter_ = &prometheus::BuildCounter()
            .Name("telemetry_spans_exported_total")
            .Help("Finished spans accepted by the exporter")
            .Register(*registry)
            .Add({});
    }
    worker_ = std::thread(&SpanRecorder::worker_loop, this);
}

SpanRecorder::~SpanRecorder() {
    shutdown();
}

Span SpanRecorder::start_span(const std::string& name,
                              SpanKind kind,
                              Attributes attributes,
                              const std::optional<TraceContext>& parent) {
    SpanData data;
    data.name = name;
    data.kind = kind;
    data.attributes = std::move(attributes);
    data.start_time = std::chrono::system_clock::now();

    TraceId trace_id;
    bool sampled;
    // Only a valid, sampled parent continues its trace
    if (parent && parent->is_valid() && parent->sampled()) {
        trace_id = parent->trace_id();
        sampled = true;
        data.parent = parent;
    } else {
        trace_id = ids_.new_trace_id();
        sampled = sampler_.should_sample(trace_id);
    }
    data.context = TraceContext(trace_id, ids_.new_span_id(), sampled);

    return Span(std::move(data));
}

void SpanRecorder::end_span(Span& span, StatusCode status,
                            const std::optional<ExceptionInfo>& exception) noexcept {
    if (span.ended_) {
        return;
    }
    if (exception) {
        span.data_.exception = exception;
        if (span.data_.status_message.empty()) {
            span.data_.status_message = exception->message;
        }
    }
    span.data_.status = status;
    span.data_.end_time = std::chrono::system_clock::now();
    span.ended_ = true;

    if (!span.data_.context.sampled()) {
        return;
    }

    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ || buffer_.size() >= options_.max_queue_size) {
            dropped = true;
        } else {
            buffer_.push_back(span.data_);
            if (buffer_.size() >= options_.max_export_batch_size) {
                cv_.notify_one();
            }
        }
    }
    if (dropped) {
        dropped_.fetch_add(1);
        if (dropped_counter_) {
            dropped_counter_->Increment();
        }
    }
}

bool SpanRecorder::force_flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_) {
        return buffer_.empty() && retry_queue_.empty();
    }
    flush_requested_ = true;
    cv_.notify_all();
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return buffer_.empty() && retry_queue_.empty() && in_flight_ == 0;
    });
}

void SpanRecorder::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    exporter_->shutdown();
}

size_t SpanRecorder::buffered_spans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

bool SpanRecorder::export_once(const PendingBatch& batch) {
    try {
        return exporter_->export_batch(batch.spans) == ExportResult::success;
    } catch (const std::exception& e) {
        logger_.log_warn("Span exporter threw", {
            {"error", e.what()},
            {"batch_size", std::to_string(batch.spans.size())}
        });
        return false;
    }
}

void SpanRecorder::record_drop(size_t count, const std::string& reason) {
    dropped_.fetch_add(count);
    if (dropped_counter_) {
        dropped_counter_->Increment(static_cast<double>(count));
    }
    logger_.log_error("Dropping span batch", {
        {"reason", reason},
        {"spans", std::to_string(count)}
    });
}

void SpanRecorder::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto next_scheduled = std::chrono::steady_clock::now() + options_.schedule_delay;

    while (true) {
        auto wake_at = next_scheduled;
        for (const auto& pending : retry_queue_) {
            wake_at = std::min(wake_at, pending.not_before);
        }
        cv_.wait_until(lock, wake_at, [this]() {
            return stop_ || flush_requested_ || buffer_.size() >= options_.max_export_batch_size;
        });

        auto now = std::chrono::steady_clock::now();
        bool draining = stop_ || flush_requested_;
        bool scheduled = now >= next_scheduled;
        if (scheduled) {
            next_scheduled = now + options_.schedule_delay;
        }

        std::vector<PendingBatch> work;
        for (auto it = retry_queue_.begin(); it != retry_queue_.end();) {
            if (draining || it->not_before <= now) {
                work.push_back(std::move(*it));
                it = retry_queue_.erase(it);
            } else {
                ++it;
            }
        }

        // On a size trigger only full batches go out; otherwise everything
        while (!buffer_.empty()) {
            if (!draining && !scheduled && buffer_.size() < options_.max_export_batch_size) {
                break;
            }
            PendingBatch batch;
            size_t count = std::min(options_.max_export_batch_size, buffer_.size());
            batch.spans.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                batch.spans.push_back(std::move(buffer_.front()));
                buffer_.pop_front();
            }
            work.push_back(std::move(batch));
        }

        if (work.empty()) {
            if (draining && buffer_.empty() && retry_queue_.empty() && in_flight_ == 0) {
                flush_requested_ = false;
                idle_cv_.notify_all();
                if (stop_) {
                    break;
                }
            }
            continue;
        }

        in_flight_ += work.size();
        lock.unlock();

        std::vector<bool> results;
        results.reserve(work.size());
        for (const auto& batch : work) {
            results.push_back(export_once(batch));
        }

        std::vector<size_t> dropped_batches;
        lock.lock();
        auto retry_base = std::chrono::steady_clock::now();
        for (size_t i = 0; i < work.size(); ++i) {
            auto& batch = work[i];
            if (results[i]) {
                exported_.fetch_add(batch.spans.size());
                if (exported_counter_) {
                    exported_counter_->Increment(static_cast<double>(batch.spans.size()));
                }
                continue;
            }
            batch.failed_attempts++;
            if (retry_policy_.should_retry(batch.failed_attempts)) {
                batch.not_before = retry_base + std::chrono::milliseconds(
                    retry_policy_.calculate_backoff_delay(batch.failed_attempts));
                retry_queue_.push_back(std::move(batch));
            } else {
                dropped_batches.push_back(batch.spans.size());
            }
        }
        in_flight_ -= work.size();

        if (!dropped_batches.empty()) {
            lock.unlock();
            for (size_t count : dropped_batches) {
                record_drop(count, "export attempts exhausted");
            }
            lock.lock();
        }
        idle_cv_.notify_all();
    }
}

// SpanScope

SpanScope::SpanScope(SpanRecorder& recorder, Span span)
    : SpanScope(recorder, std::move(span), current_baggage()) {}

SpanScope::SpanScope(SpanRecorder& recorder, Span span, const Baggage& baggage)
    : recorder_(recorder),
      span_(std::move(span)),
      context_scope_(span_.context(), baggage),
      uncaught_at_start_(std::uncaught_exceptions()) {}

SpanScope::~SpanScope() {
    if (span_.ended()) {
        context_scope_.detach();
        return;
    }
    if (std::uncaught_exceptions() > uncaught_at_start_) {
        context_scope_.detach();
        recorder_.end_span(span_, StatusCode::error);
    } else {
        end(StatusCode::ok);
    }
}

void SpanScope::end(StatusCode status) {
    context_scope_.detach();
    recorder_.end_span(span_, status);
}

void SpanScope::fail(const ExceptionInfo& exception) {
    context_scope_.detach();
    recorder_.end_span(span_, StatusCode::error, exception);
}

} // namespace telemetry
} // namespace tracehop
