#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include "server/request_router.hpp"

namespace tabula::server {

struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
};

// Parse a complete request (request line, headers, body). Returns nullopt
// if the request line is malformed.
std::optional<HttpRequest> parse_http_request(const std::string& raw);

// POST /api/insert, GET /api/find, PUT /api/update, DELETE /api/delete,
// GET /api/tables, POST /api/save. UNKNOWN for anything else.
RequestOp route_for(const std::string& method, const std::string& path);

std::string format_http_response(int status, const std::string& body);

struct HttpServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    size_t max_request_bytes = 1024 * 1024;
    int read_timeout_ms = 5000;
};

/**
 * Minimal HTTP front end for RequestRouter.
 *
 * One request per connection, connections handled one at a time on the
 * thread that calls run(). The JSON body is the request envelope without
 * "op"; the route supplies it.
 */
class HttpServer {
public:
    HttpServer(RequestRouter& router, HttpServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen. Returns false on failure (logged).
    bool start();

    // Accept loop; returns after stop(). Call start() first.
    void run();

    // Safe to call from a signal-driven thread.
    void stop() { running_ = false; }

    uint16_t port() const { return bound_port_; }

    // Route one parsed request and produce the full HTTP response.
    std::string handle_request(const HttpRequest& request);

private:
    RequestRouter& router_;
    HttpServerConfig config_;
    int listen_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};

    void serve_connection(int fd);
    std::optional<std::string> read_request(int fd);
};

} // namespace tabula::server
