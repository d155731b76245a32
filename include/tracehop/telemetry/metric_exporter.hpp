#pragma once

#include "tracehop/telemetry/logger.hpp"
#include <prometheus/metric_family.h>
#include <prometheus/registry.h>
#include <chrono>
#include <condition_variable>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tracehop {
namespace telemetry {

// Sink for metric snapshots
class MetricExporter {
public:
    virtual ~MetricExporter() = default;
    virtual void export_metrics(const std::vector<prometheus::MetricFamily>& families) = 0;
};

// Prometheus text exposition format
std::string serialize_metrics(const std::vector<prometheus::MetricFamily>& families);

class TextMetricExporter : public MetricExporter {
public:
    explicit TextMetricExporter(std::ostream& out) : out_(out) {}

    void export_metrics(const std::vector<prometheus::MetricFamily>& families) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

// Keeps every snapshot. Used by tests.
class InMemoryMetricExporter : public MetricExporter {
public:
    void export_metrics(const std::vector<prometheus::MetricFamily>& families) override;

    size_t export_count() const;
    std::vector<prometheus::MetricFamily> last_snapshot() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::vector<prometheus::MetricFamily>> snapshots_;
};

/**
 * Collects the registry every `interval` on its own thread and hands the
 * snapshot to the exporter. stop() exports one final snapshot.
 */
class PeriodicMetricReader {
public:
    PeriodicMetricReader(std::shared_ptr<prometheus::Registry> registry,
                         std::shared_ptr<MetricExporter> exporter,
                         std::chrono::milliseconds interval,
                         Logger& logger);
    ~PeriodicMetricReader();

    PeriodicMetricReader(const PeriodicMetricReader&) = delete;
    PeriodicMetricReader& operator=(const PeriodicMetricReader&) = delete;

    void start();
    void stop();
    bool running() const;

    // Synchronous collect + export on the calling thread
    void collect_now();

private:
    void run();

    std::shared_ptr<prometheus::Registry> registry_;
    std::shared_ptr<MetricExporter> exporter_;
    std::chrono::milliseconds interval_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::mutex export_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    bool stop_requested_ = false;
    std::thread thread_;
};

} // namespace telemetry
} // namespace tracehop
