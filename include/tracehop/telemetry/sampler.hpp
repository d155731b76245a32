#pragma once

#include "tracehop/telemetry/core.hpp"
#include <algorithm>
#include <cstdint>
#include <mutex>
#include <random>

namespace tracehop {
namespace telemetry {

/**
 * Trace-id ratio sampler.
 *
 * Decides only for new traces; children inherit the parent's flag in
 * SpanRecorder. The decision is a pure function of the trace id: the
 * low 8 bytes are compared against ratio * 2^63 the same way the
 * OpenTelemetry TraceIdRatioBased sampler does, so every process that
 * samples with the same ratio agrees on the same traces.
 */
class RatioSampler {
public:
    explicit RatioSampler(double ratio = 1.0)
        : ratio_(std::min(1.0, std::max(0.0, ratio))) {
        if (ratio_ >= 1.0) {
            threshold_ = UINT64_MAX;
        } else if (ratio_ <= 0.0) {
            threshold_ = 0;
        } else {
            threshold_ = static_cast<uint64_t>(ratio_ * static_cast<double>(UINT64_MAX >> 1));
        }
    }

    double ratio() const { return ratio_; }

    bool should_sample(const TraceId& trace_id) const {
        if (threshold_ == 0) {
            return false;
        }
        if (threshold_ == UINT64_MAX) {
            return true;
        }
        uint64_t value = 0;
        for (size_t i = 8; i < 16; ++i) {
            value = (value << 8) | trace_id[i];
        }
        return (value >> 1) < threshold_;
    }

private:
    double ratio_;
    uint64_t threshold_ = UINT64_MAX;
};

// Random non-zero trace/span ids
class IdGenerator {
public:
    IdGenerator() : engine_(std::random_device{}()) {}

    TraceId new_trace_id() {
        TraceId id{};
        do {
            fill(id.data(), id.size());
        } while (std::all_of(id.begin(), id.end(), [](uint8_t b) { return b == 0; }));
        return id;
    }

    SpanId new_span_id() {
        SpanId id{};
        do {
            fill(id.data(), id.size());
        } while (std::all_of(id.begin(), id.end(), [](uint8_t b) { return b == 0; }));
        return id;
    }

private:
    void fill(uint8_t* out, size_t size) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < size; i += 8) {
            uint64_t value = engine_();
            for (size_t j = 0; j < 8 && i + j < size; ++j) {
                out[i + j] = static_cast<uint8_t>(value >> (j * 8));
            }
        }
    }

    std::mt19937_64 engine_;
    std::mutex mutex_;
};

} // namespace telemetry
} // namespace tracehop
