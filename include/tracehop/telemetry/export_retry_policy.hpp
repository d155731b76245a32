#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace tracehop {
namespace telemetry {

/**
 * Retry policy for failed span export batches.
 *
 * Implements:
 * - Exponential backoff between attempts
 * - Attempt budget (a batch is dropped once max_attempts is reached)
 */
class ExportRetryPolicy {
public:
    struct Config {
        int64_t base_delay_ms = 100;      // Base delay for exponential backoff
        int64_t max_delay_ms = 5000;      // Maximum delay between attempts
        int32_t max_attempts = 3;         // Attempts per batch, first one included
    };

    ExportRetryPolicy(const Config& config = Config()) : config_(config) {}

    /**
     * Delay before the next attempt after `failed_attempts` failures.
     * Formula: delay = base * 2^(failed_attempts - 1) (capped at max_delay_ms)
     */
    int64_t calculate_backoff_delay(int32_t failed_attempts) const {
        if (failed_attempts <= 1) {
            return std::min(config_.base_delay_ms, config_.max_delay_ms);
        }
        int32_t shift = std::min(failed_attempts - 1, 30);
        int64_t delay = config_.base_delay_ms * (1LL << shift);
        return std::min(delay, config_.max_delay_ms);
    }

    // True while the batch still has attempts left
    bool should_retry(int32_t failed_attempts) const {
        return failed_attempts < config_.max_attempts;
    }

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace telemetry
} // namespace tracehop
