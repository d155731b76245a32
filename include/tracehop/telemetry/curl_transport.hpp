#pragma once

#include "tracehop/telemetry/http_message.hpp"
#include <stdexcept>
#include <string>

namespace tracehop {
namespace telemetry {

// Raised when no HTTP response was obtained (DNS, connect, timeout, ...)
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Blocking libcurl transport.
 *
 * Supports GET, POST, PUT and DELETE with request headers and separate
 * connect/total timeouts. Any HTTP status is a response; only transport
 * failures throw TransportError.
 */
class CurlHttpTransport {
public:
    CurlHttpTransport();

    HttpResponse send(const HttpRequest& request) const;

    HttpResponse operator()(const HttpRequest& request) const { return send(request); }

private:
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, Headers* userdata);
};

} // namespace telemetry
} // namespace tracehop
