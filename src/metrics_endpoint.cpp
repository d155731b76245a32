#include "tracehop/telemetry/metrics_endpoint.hpp"
#include "tracehop/telemetry/metric_exporter.hpp"
#include <nlohmann/json.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace tracehop {
namespace telemetry {

using json = nlohmann::json;

namespace {

std::string http_response(const std::string& status_line,
                          const std::string& content_type,
                          const std::string& body) {
    return "HTTP/1.1 " + status_line + "\r\n"
           "Content-Type: " + content_type + "\r\n"
           "Content-Length: " + std::to_string(body.length()) + "\r\n"
           "Connection: close\r\n"
           "\r\n" + body;
}

void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace

MetricsEndpoint::MetricsEndpoint(std::shared_ptr<prometheus::Registry> registry,
                                 std::string service_name,
                                 HealthCheck collector_healthy,
                                 Logger& logger)
    : registry_(std::move(registry)),
      service_name_(std::move(service_name)),
      collector_healthy_(std::move(collector_healthy)),
      logger_(logger) {}

MetricsEndpoint::~MetricsEndpoint() {
    stop();
}

std::string MetricsEndpoint::get_metrics_response() const {
    if (!registry_) {
        return "";
    }
    return serialize_metrics(registry_->Collect());
}

std::string MetricsEndpoint::get_health_response() const {
    bool collector_up = collector_healthy_ ? collector_healthy_() : true;

    json health_response;
    health_response["status"] = collector_up ? "healthy" : "degraded";
    health_response["timestamp"] = iso8601_timestamp();
    health_response["collector"] = collector_up ? "up" : "down";
    health_response["service"] = service_name_;
    return health_response.dump();
}

void MetricsEndpoint::server_loop(int socket_fd) {
    char buffer[4096];

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(socket_fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) {
                continue;
            }
            break;
        }

        ssize_t bytes_read = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
        if (bytes_read > 0) {
            buffer[bytes_read] = '\0';
            std::string request(buffer);

            std::string response;
            if (request.rfind("GET /metrics", 0) == 0) {
                response = http_response("200 OK", "text/plain; version=0.0.4", get_metrics_response());
            } else if (request.rfind("GET /_health", 0) == 0) {
                response = http_response("200 OK", "application/json", get_health_response());
            } else {
                response = http_response("404 Not Found", "text/plain", "404 Not Found");
            }
            send_all(client_fd, response);
        }

        close(client_fd);
    }
}

bool MetricsEndpoint::start(const std::string& address, uint16_t port) {
    if (running_) {
        return true;
    }

    struct sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &server_addr.sin_addr) != 1) {
        logger_.log_error("Invalid metrics endpoint address", {
            {"address", address}
        });
        return false;
    }

    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        logger_.log_error("Failed to create metrics endpoint socket", {
            {"error", std::strerror(errno)}
        });
        return false;
    }

    int opt = 1;
    setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(socket_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        logger_.log_error("Failed to bind metrics endpoint socket", {
            {"error", std::strerror(errno)},
            {"address", address},
            {"port", std::to_string(port)}
        });
        close(socket_fd);
        return false;
    }

    if (listen(socket_fd, 16) < 0) {
        logger_.log_error("Failed to listen on metrics endpoint socket", {
            {"error", std::strerror(errno)}
        });
        close(socket_fd);
        return false;
    }

    server_socket_ = socket_fd;
    running_ = true;
    server_thread_ = std::thread(&MetricsEndpoint::server_loop, this, socket_fd);

    logger_.log_info("Metrics endpoint started", {
        {"address", address},
        {"port", std::to_string(port)}
    });
    return true;
}

void MetricsEndpoint::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    // Wake up accept()
    if (server_socket_ >= 0) {
        ::shutdown(server_socket_, SHUT_RDWR);
        close(server_socket_);
        server_socket_ = -1;
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    logger_.log_info("Metrics endpoint stopped");
}

} // namespace telemetry
} // namespace tracehop
