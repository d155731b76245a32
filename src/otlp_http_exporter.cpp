#include "tracehop/telemetry/otlp_http_exporter.hpp"
#include "tracehop/telemetry/curl_transport.hpp"

namespace tracehop {
namespace telemetry {

using json = nlohmann::json;

namespace {

constexpr const char* kScopeName = "tracehop";
constexpr const char* kScopeVersion = "1.0.0";

int otlp_kind(SpanKind kind) {
    switch (kind) {
        case SpanKind::internal:
            return 1;
        case SpanKind::server:
            return 2;
        case SpanKind::client:
            return 3;
        case SpanKind::producer:
            return 4;
        case SpanKind::consumer:
            return 5;
    }
    return 0;
}

int otlp_status(StatusCode status) {
    switch (status) {
        case StatusCode::unset:
            return 0;
        case StatusCode::ok:
            return 1;
        case StatusCode::error:
            return 2;
    }
    return 0;
}

std::string unix_nanos(std::chrono::system_clock::time_point tp) {
    return std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count());
}

// AnyValue; 64-bit integers travel as strings in OTLP/JSON
json any_value(const AttributeValue& value) {
    if (value.is_boolean()) {
        return {{"boolValue", value.get<bool>()}};
    }
    if (value.is_number_integer()) {
        return {{"intValue", std::to_string(value.get<int64_t>())}};
    }
    if (value.is_number_float()) {
        return {{"doubleValue", value.get<double>()}};
    }
    if (value.is_string()) {
        return {{"stringValue", value.get<std::string>()}};
    }
    return {{"stringValue", value.dump(-1, ' ', false, json::error_handler_t::replace)}};
}

json key_value(const std::string& key, const AttributeValue& value) {
    return {{"key", key}, {"value", any_value(value)}};
}

json otlp_span(const SpanData& span) {
    json out;
    out["traceId"] = span.context.trace_id_hex();
    out["spanId"] = span.context.span_id_hex();
    if (span.parent && span.parent->is_valid()) {
        out["parentSpanId"] = span.parent->span_id_hex();
    }
    out["name"] = span.name;
    out["kind"] = otlp_kind(span.kind);
    out["startTimeUnixNano"] = unix_nanos(span.start_time);
    out["endTimeUnixNano"] = unix_nanos(span.end_time);

    json attributes = json::array();
    for (const auto& [key, value] : span.attributes) {
        attributes.push_back(key_value(key, value));
    }
    out["attributes"] = attributes;

    if (span.exception) {
        json event;
        event["name"] = "exception";
        event["timeUnixNano"] = unix_nanos(span.end_time);
        event["attributes"] = json::array({
            key_value("exception.type", span.exception->type),
            key_value("exception.message", span.exception->message)
        });
        out["events"] = json::array({event});
    }

    json status;
    status["code"] = otlp_status(span.status);
    if (!span.status_message.empty()) {
        status["message"] = span.status_message;
    }
    out["status"] = status;
    return out;
}

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

json to_otlp_json(const std::vector<SpanData>& spans, const ResourceInfo& resource) {
    json resource_attributes = json::array({
        key_value("service.name", resource.service_name),
        key_value("service.version", resource.service_version),
        key_value("deployment.environment", resource.environment)
    });

    json otlp_spans = json::array();
    for (const auto& span : spans) {
        otlp_spans.push_back(otlp_span(span));
    }

    json scope_spans;
    scope_spans["scope"] = {{"name", kScopeName}, {"version", kScopeVersion}};
    scope_spans["spans"] = otlp_spans;

    json resource_spans;
    resource_spans["resource"] = {{"attributes", resource_attributes}};
    resource_spans["scopeSpans"] = json::array({scope_spans});

    json body;
    body["resourceSpans"] = json::array({resource_spans});
    return body;
}

OtlpHttpSpanExporter::OtlpHttpSpanExporter(const TelemetryConfig& config, HttpSendFn send)
    : resource_(ResourceInfo::from_config(config)),
      traces_url_(strip_trailing_slash(config.collector_endpoint) + "/v1/traces"),
      health_url_(config.collector_health_endpoint),
      timeout_ms_(config.export_timeout_ms),
      send_(std::move(send)) {
    if (!send_) {
        CurlHttpTransport transport;
        send_ = [transport](const HttpRequest& request) { return transport.send(request); };
    }
}

ExportResult OtlpHttpSpanExporter::export_batch(const std::vector<SpanData>& spans) {
    if (shutdown_) {
        return ExportResult::failure;
    }
    if (spans.empty()) {
        return ExportResult::success;
    }

    HttpRequest request;
    request.method = "POST";
    request.url = traces_url_;
    request.headers["Content-Type"] = "application/json";
    // Invalid UTF-8 in span fields is replaced so one span cannot drop the batch
    request.body = to_otlp_json(spans, resource_).dump(-1, ' ', false, json::error_handler_t::replace);
    request.timeout_ms = timeout_ms_;

    try {
        HttpResponse response = send_(request);
        return response.ok() ? ExportResult::success : ExportResult::failure;
    } catch (const TransportError&) {
        return ExportResult::failure;
    }
}

bool OtlpHttpSpanExporter::is_healthy() {
    HttpRequest request;
    request.method = "GET";
    request.url = health_url_;
    request.timeout_ms = 2000;
    request.connect_timeout_ms = 1000;

    try {
        return send_(request).status_code == 200;
    } catch (const TransportError&) {
        return false;
    }
}

void OtlpHttpSpanExporter::shutdown() {
    shutdown_ = true;
}

} // namespace telemetry
} // namespace tracehop
