#pragma once

#include "tracehop/telemetry/http_message.hpp"
#include "tracehop/telemetry/logger.hpp"
#include "tracehop/telemetry/metric_registry.hpp"
#include "tracehop/telemetry/span_recorder.hpp"
#include <functional>
#include <string>

namespace tracehop {
namespace telemetry {

using HttpClientFn = std::function<HttpResponse(const HttpRequest&)>;
using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

// URL without query string or fragment ("http://svc:8080/orders?id=1" -> "http://svc:8080/orders")
std::string destination_for(const std::string& url);

// "" for 2xx, "http_1xx" .. "http_5xx" for other statuses in 100..599,
// "invalid_status" outside that range
std::string error_kind_for_status(int status_code);

/**
 * Tracing for synchronous HTTP hops.
 *
 * Clients: CLIENT span `HTTP <METHOD>`, context and baggage injected into a
 * copy of the request headers, duration recorded per destination and
 * method. Servers: context extracted from the request, SERVER span
 * `<METHOD> <route>` active while the handler runs.
 *
 * Non-2xx responses end the span with ERROR and count
 * http_errors_total{error_kind="http_<N>xx"}. Transport exceptions count
 * error_kind="transport", handler exceptions error_kind="exception"; both
 * are rethrown unchanged. HTTP metrics never create messaging series.
 */
class HttpPropagation {
public:
    HttpPropagation(SpanRecorder& recorder, MetricRegistry& metrics, Logger& logger);

    HttpClientFn wrap_client(HttpClientFn send);
    HttpHandler wrap_server(const std::string& route, HttpHandler handler);

private:
    HttpResponse client_instrumented(const HttpClientFn& send, const HttpRequest& request);
    HttpResponse server_instrumented(const std::string& route, const HttpHandler& handler, const HttpRequest& request);

    void record_request(const std::string& destination, const std::string& method,
                        double duration_ms, const std::string& error_kind);

    SpanRecorder& recorder_;
    MetricRegistry& metrics_;
    Logger& logger_;
};

} // namespace telemetry
} // namespace tracehop
