#include "tracehop/telemetry/metric_exporter.hpp"
#include <prometheus/text_serializer.h>
#include <ostream>
#include <stdexcept>

namespace tracehop {
namespace telemetry {

std::string serialize_metrics(const std::vector<prometheus::MetricFamily>& families) {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(families);
}

void TextMetricExporter::export_metrics(const std::vector<prometheus::MetricFamily>& families) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << serialize_metrics(families);
    out_.flush();
}

void InMemoryMetricExporter::export_metrics(const std::vector<prometheus::MetricFamily>& families) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.push_back(families);
}

size_t InMemoryMetricExporter::export_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

std::vector<prometheus::MetricFamily> InMemoryMetricExporter::last_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshots_.empty()) {
        return {};
    }
    return snapshots_.back();
}

PeriodicMetricReader::PeriodicMetricReader(std::shared_ptr<prometheus::Registry> registry,
                                           std::shared_ptr<MetricExporter> exporter,
                                           std::chrono::milliseconds interval,
                                           Logger& logger)
    : registry_(std::move(registry)),
      exporter_(std::move(exporter)),
      interval_(interval),
      logger_(logger) {
    if (!registry_ || !exporter_) {
        throw std::invalid_argument("PeriodicMetricReader requires a registry and an exporter");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("metric export interval must be positive");
    }
}

PeriodicMetricReader::~PeriodicMetricReader() {
    stop();
}

void PeriodicMetricReader::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    stop_requested_ = false;
    thread_ = std::thread(&PeriodicMetricReader::run, this);
}

void PeriodicMetricReader::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    collect_now();
}

bool PeriodicMetricReader::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PeriodicMetricReader::collect_now() {
    std::lock_guard<std::mutex> lock(export_mutex_);
    try {
        exporter_->export_metrics(registry_->Collect());
    } catch (const std::exception& e) {
        logger_.log_warn("Metric export failed", {
            {"error", e.what()}
        });
    }
}

void PeriodicMetricReader::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this]() { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        collect_now();
        lock.lock();
    }
}

} // namespace telemetry
} // namespace tracehop
