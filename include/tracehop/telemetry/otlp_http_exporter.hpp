#pragma once

#include "tracehop/telemetry/config.hpp"
#include "tracehop/telemetry/http_message.hpp"
#include "tracehop/telemetry/span_exporter.hpp"
#include <atomic>
#include <functional>
#include <string>

namespace tracehop {
namespace telemetry {

using HttpSendFn = std::function<HttpResponse(const HttpRequest&)>;

// Identity attached to every exported batch
struct ResourceInfo {
    std::string service_name;
    std::string service_version;
    std::string environment;

    static ResourceInfo from_config(const TelemetryConfig& config) {
        return ResourceInfo{config.service_name, config.service_version, config.environment};
    }
};

// OTLP/JSON ExportTraceServiceRequest body for one batch
nlohmann::json to_otlp_json(const std::vector<SpanData>& spans, const ResourceInfo& resource);

/**
 * Span exporter for an OTLP/HTTP collector (JSON encoding).
 *
 * POSTs each batch to `{collector_endpoint}/v1/traces`. Any non-2xx answer
 * or transport failure is reported as ExportResult::failure; the recorder
 * owns the retry decision. is_healthy() checks the collector's
 * health_check extension.
 */
class OtlpHttpSpanExporter : public SpanExporter {
public:
    explicit OtlpHttpSpanExporter(const TelemetryConfig& config, HttpSendFn send = nullptr);

    ExportResult export_batch(const std::vector<SpanData>& spans) override;
    bool is_healthy() override;
    void shutdown() override;

    const std::string& traces_url() const { return traces_url_; }

private:
    ResourceInfo resource_;
    std::string traces_url_;
    std::string health_url_;
    int64_t timeout_ms_;
    HttpSendFn send_;
    std::atomic<bool> shutdown_{false};
};

} // namespace telemetry
} // namespace tracehop
