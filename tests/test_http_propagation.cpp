#include <iostream>
#include <cassert>
#include <optional>
#include <stdexcept>
#include <string>
#include "tracehop/telemetry/context_scope.hpp"
#include "tracehop/telemetry/curl_transport.hpp"
#include "tracehop/telemetry/http_propagation.hpp"
#include "support/test_telemetry.hpp"

using namespace tracehop::telemetry;
using tracehop::telemetry::testing::TestTelemetry;
using tracehop::telemetry::testing::find_span;
using tracehop::telemetry::testing::histogram_count;

void test_client_server_hop_shares_trace() {
    std::cout << "Testing client -> server hop..." << std::endl;

    TestTelemetry telemetry;
    HttpPropagation http(*telemetry.recorder, *telemetry.metrics, telemetry.logger);

    std::optional<std::string> tenant_in_handler;
    auto handler = http.wrap_server("/items", [&](const HttpRequest&) {
        tenant_in_handler = current_baggage().get("tenant");
        HttpResponse response;
        response.status_code = 200;
        response.body = "[]";
        return response;
    });

    // Client transport calls the server handler in-process
    auto client = http.wrap_client([&handler](const HttpRequest& request) {
        HttpRequest server_request = request;
        server_request.url = "/items";
        return handler(server_request);
    });

    HttpRequest request;
    request.method = "GET";
    request.url = "http://inventory:8080/items?sku=42";

    HttpResponse response;
    {
        SpanScope root(*telemetry.recorder,
                       telemetry.recorder->start_span("checkout", SpanKind::internal),
                       Baggage().set("tenant", "acme"));
        response = client(request);
    }
    assert(response.status_code == 200);
    assert(request.headers.empty());
    assert(tenant_in_handler.value() == "acme");

    auto spans = telemetry.flushed_spans();
    const SpanData* root = find_span(spans, "checkout");
    const SpanData* client_span = find_span(spans, "HTTP GET");
    const SpanData* server_span = find_span(spans, "GET /items");
    assert(root && client_span && server_span);

    assert(client_span->kind == SpanKind::client);
    assert(server_span->kind == SpanKind::server);
    assert(client_span->context.trace_id() == root->context.trace_id());
    assert(server_span->context.trace_id() == root->context.trace_id());
    assert(server_span->parent.has_value());
    assert(server_span->parent->span_id() == client_span->context.span_id());

    assert(client_span->attributes.at("http.url") == "http://inventory:8080/items");
    assert(client_span->attributes.at("http.status_code") == 200);
    assert(client_span->status == StatusCode::ok);

    auto instruments = telemetry.metrics->get_or_create_http("http://inventory:8080/items");
    assert(histogram_count(instruments->request_duration("GET")) == 1);
    assert(telemetry.metrics->size() == 0);

    std::cout << "✓ Client/server hop test passed" << std::endl;
}

void test_server_error_status() {
    std::cout << "Testing 503 response..." << std::endl;

    TestTelemetry telemetry;
    HttpPropagation http(*telemetry.recorder, *telemetry.metrics, telemetry.logger);

    auto client = http.wrap_client([](const HttpRequest&) {
        HttpResponse response;
        response.status_code = 503;
        return response;
    });

    HttpRequest request;
    request.method = "POST";
    request.url = "http://payments:8080/charge";
    HttpResponse response = client(request);
    assert(response.status_code == 503);

    auto spans = telemetry.flushed_spans();
    const SpanData* span = find_span(spans, "HTTP POST");
    assert(span != nullptr);
    assert(span->status == StatusCode::error);
    assert(span->status_message == "HTTP 503");

    auto instruments = telemetry.metrics->get_or_create_http("http://payments:8080/charge");
    assert(instruments->errors("http_5xx").Value() == 1);
    assert(histogram_count(instruments->request_duration("POST")) == 1);

    std::cout << "✓ 503 response test passed" << std::endl;
}

void test_transport_error_rethrown() {
    std::cout << "Testing transport failure..." << std::endl;

    TestTelemetry telemetry;
    HttpPropagation http(*telemetry.recorder, *telemetry.metrics, telemetry.logger);

    auto client = http.wrap_client([](const HttpRequest&) -> HttpResponse {
        throw TransportError("Couldn't connect to server");
    });

    HttpRequest request;
    request.url = "http://payments:8080/charge";

    bool caught = false;
    try {
        client(request);
    } catch (const TransportError& e) {
        caught = true;
        assert(std::string(e.what()) == "Couldn't connect to server");
    }
    assert(caught);

    auto spans = telemetry.flushed_spans();
    const SpanData* span = find_span(spans, "HTTP GET");
    assert(span != nullptr);
    assert(span->status == StatusCode::error);
    assert(span->exception.has_value());
    assert(span->exception->type == "tracehop::telemetry::TransportError");

    auto instruments = telemetry.metrics->get_or_create_http("http://payments:8080/charge");
    assert(instruments->errors("transport").Value() == 1);

    std::cout << "✓ Transport failure test passed" << std::endl;
}

void test_server_without_headers_starts_trace() {
    std::cout << "Testing server span without incoming context..." << std::endl;

    TestTelemetry telemetry;
    HttpPropagation http(*telemetry.recorder, *telemetry.metrics, telemetry.logger);

    std::optional<TraceContext> active;
    auto handler = http.wrap_server("/health", [&active](const HttpRequest&) {
        active = current_context();
        HttpResponse response;
        response.status_code = 200;
        return response;
    });

    HttpRequest request;
    request.url = "/health";
    handler(request);

    auto spans = telemetry.flushed_spans();
    const SpanData* span = find_span(spans, "GET /health");
    assert(span != nullptr);
    assert(!span->parent.has_value());
    assert(active.has_value());
    assert(*active == span->context);
    assert(!current_context().has_value());

    std::cout << "✓ Server root span test passed" << std::endl;
}

void test_bookkeeping_failure_does_not_affect_handler() {
    std::cout << "Testing server bookkeeping with invalid UTF-8 route..." << std::endl;

    TestTelemetry telemetry;
    HttpPropagation http(*telemetry.recorder, *telemetry.metrics, telemetry.logger);

    int calls = 0;
    auto handler = http.wrap_server("/items/\xc3", [&calls](const HttpRequest&) {
        ++calls;
        HttpResponse response;
        response.status_code = 201;
        response.body = "created";
        return response;
    });

    HttpRequest request;
    request.method = "POST";
    request.url = "/items/\xc3";
    HttpResponse response = handler(request);

    assert(calls == 1);
    assert(response.status_code == 201);
    assert(response.body == "created");
    assert(telemetry.log_out.str().find("No trace context in request headers") != std::string::npos);

    // A zero status is still passed through, recorded as invalid
    auto zero = http.wrap_server("/zero", [](const HttpRequest&) { return HttpResponse(); });
    HttpRequest zero_request;
    zero_request.url = "/zero";
    assert(zero(zero_request).status_code == 0);
    assert(telemetry.metrics->get_or_create_http("/zero")->errors("invalid_status").Value() == 1);

    std::cout << "✓ Bookkeeping failure test passed" << std::endl;
}

void test_handler_exception_recorded() {
    std::cout << "Testing handler exception..." << std::endl;

    TestTelemetry telemetry;
    HttpPropagation http(*telemetry.recorder, *telemetry.metrics, telemetry.logger);

    auto handler = http.wrap_server("/orders", [](const HttpRequest&) -> HttpResponse {
        throw std::logic_error("bad state");
    });

    HttpRequest request;
    request.method = "POST";
    request.url = "/orders";

    bool caught = false;
    try {
        handler(request);
    } catch (const std::logic_error&) {
        caught = true;
    }
    assert(caught);

    auto spans = telemetry.flushed_spans();
    const SpanData* span = find_span(spans, "POST /orders");
    assert(span != nullptr);
    assert(span->status == StatusCode::error);
    assert(telemetry.metrics->get_or_create_http("/orders")->errors("exception").Value() == 1);

    std::cout << "✓ Handler exception test passed" << std::endl;
}

void test_helpers() {
    std::cout << "Testing destination and error kind helpers..." << std::endl;

    assert(destination_for("http://svc:8080/orders?id=1") == "http://svc:8080/orders");
    assert(destination_for("http://svc:8080/orders#top") == "http://svc:8080/orders");
    assert(destination_for("http://svc:8080/orders") == "http://svc:8080/orders");

    assert(error_kind_for_status(200).empty());
    assert(error_kind_for_status(204).empty());
    assert(error_kind_for_status(404) == "http_4xx");
    assert(error_kind_for_status(503) == "http_5xx");
    assert(error_kind_for_status(301) == "http_3xx");
    assert(error_kind_for_status(101) == "http_1xx");
    assert(error_kind_for_status(0) == "invalid_status");
    assert(error_kind_for_status(-1) == "invalid_status");
    assert(error_kind_for_status(99) == "invalid_status");
    assert(error_kind_for_status(600) == "invalid_status");
    assert(error_kind_for_status(999) == "invalid_status");

    std::cout << "✓ Helper test passed" << std::endl;
}

int main() {
    std::cout << "=== HTTP Propagation Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_client_server_hop_shares_trace();
        test_server_error_status();
        test_transport_error_rethrown();
        test_server_without_headers_starts_trace();
        test_bookkeeping_failure_does_not_affect_handler();
        test_handler_exception_recorded();
        test_helpers();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
