#include "tracehop/telemetry/http_propagation.hpp"
#include "tracehop/telemetry/context_codec.hpp"
#include "tracehop/telemetry/context_scope.hpp"
#include <chrono>

namespace tracehop {
namespace telemetry {

namespace {

constexpr const char* kTransportErrorKind = "transport";
constexpr const char* kHandlerErrorKind = "exception";

double elapsed_ms(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

} // namespace

std::string destination_for(const std::string& url) {
    size_t end = url.find_first_of("?#");
    if (end == std::string::npos) {
        return url;
    }
    return url.substr(0, end);
}

std::string error_kind_for_status(int status_code) {
    if (status_code >= 200 && status_code < 300) {
        return "";
    }
    if (status_code < 100 || status_code >= 600) {
        return "invalid_status";
    }
    return "http_" + std::to_string(status_code / 100) + "xx";
}

HttpPropagation::HttpPropagation(SpanRecorder& recorder, MetricRegistry& metrics, Logger& logger)
    : recorder_(recorder), metrics_(metrics), logger_(logger) {}

HttpClientFn HttpPropagation::wrap_client(HttpClientFn send) {
    return [this, send = std::move(send)](const HttpRequest& request) {
        return client_instrumented(send, request);
    };
}

HttpHandler HttpPropagation::wrap_server(const std::string& route, HttpHandler handler) {
    return [this, route, handler = std::move(handler)](const HttpRequest& request) {
        return server_instrumented(route, handler, request);
    };
}

HttpResponse HttpPropagation::client_instrumented(const HttpClientFn& send, const HttpRequest& request) {
    std::string destination = destination_for(request.url);

    SpanScope scope(recorder_,
                    recorder_.start_span("HTTP " + request.method, SpanKind::client,
                                         {{"http.method", request.method},
                                          {"http.url", destination}},
                                         current_context()));

    HttpRequest outgoing = request;
    inject(scope.context(), current_baggage(), outgoing.headers);

    auto started = std::chrono::steady_clock::now();
    HttpResponse response;
    try {
        response = send(outgoing);
    } catch (const std::exception& e) {
        record_request(destination, request.method, elapsed_ms(started), kTransportErrorKind);
        scope.fail(describe_exception(e));
        throw;
    } catch (...) {
        record_request(destination, request.method, elapsed_ms(started), kTransportErrorKind);
        scope.fail(describe_unknown_exception());
        throw;
    }

    std::string error_kind = error_kind_for_status(response.status_code);
    record_request(destination, request.method, elapsed_ms(started), error_kind);

    scope.span().set_attribute("http.status_code", response.status_code);
    if (error_kind.empty()) {
        scope.end(StatusCode::ok);
    } else {
        scope.span().set_status(StatusCode::error, "HTTP " + std::to_string(response.status_code));
        scope.end(StatusCode::error);
    }
    return response;
}

HttpResponse HttpPropagation::server_instrumented(const std::string& route,
                                                  const HttpHandler& handler,
                                                  const HttpRequest& request) {
    ExtractedContext extracted = extract(request.headers);
    std::optional<TraceContext> parent;
    if (extracted.context.is_valid()) {
        parent = extracted.context;
    } else {
        logger_.log_debug("No trace context in request headers, starting new trace", {
            {"route", route}
        });
    }

    SpanScope scope(recorder_,
                    recorder_.start_span(request.method + " " + route, SpanKind::server,
                                         {{"http.method", request.method},
                                          {"http.route", route},
                                          {"http.target", request.url}},
                                         parent),
                    extracted.baggage);

    auto started = std::chrono::steady_clock::now();
    HttpResponse response;
    try {
        response = handler(request);
    } catch (const std::exception& e) {
        record_request(route, request.method, elapsed_ms(started), kHandlerErrorKind);
        scope.fail(describe_exception(e));
        throw;
    } catch (...) {
        record_request(route, request.method, elapsed_ms(started), kHandlerErrorKind);
        scope.fail(describe_unknown_exception());
        throw;
    }

    std::string error_kind = error_kind_for_status(response.status_code);
    record_request(route, request.method, elapsed_ms(started), error_kind);

    scope.span().set_attribute("http.status_code", response.status_code);
    if (error_kind.empty()) {
        scope.end(StatusCode::ok);
    } else {
        scope.span().set_status(StatusCode::error, "HTTP " + std::to_string(response.status_code));
        scope.end(StatusCode::error);
    }
    return response;
}

void HttpPropagation::record_request(const std::string& destination, const std::string& method,
                                     double duration_ms, const std::string& error_kind) {
    try {
        auto instruments = metrics_.get_or_create_http(destination);
        instruments->request_duration(method).Observe(duration_ms);
        if (!error_kind.empty()) {
            instruments->errors(error_kind).Increment();
        }
    } catch (const std::exception& e) {
        logger_.log_warn("Failed to record HTTP metrics", {
            {"destination", destination},
            {"error", e.what()}
        });
    }
}

} // namespace telemetry
} // namespace tracehop
