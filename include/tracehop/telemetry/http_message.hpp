#pragma once

#include "tracehop/telemetry/core.hpp"
#include <cstdint>
#include <string>

namespace tracehop {
namespace telemetry {

struct HttpRequest {
    std::string method = "GET";
    std::string url;          // absolute URL for clients, path for servers
    Headers headers;
    std::string body;
    int64_t timeout_ms = 30000;
    int64_t connect_timeout_ms = 5000;
};

struct HttpResponse {
    int status_code = 0;
    Headers headers;          // lower-cased names
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

} // namespace telemetry
} // namespace tracehop
