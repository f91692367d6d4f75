#include "server/http_server.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

namespace tabula::server {

namespace {

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 413: return "Payload Too Large";
        default:  return "Internal Server Error";
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Offset of the blank line ending the headers and the length of its terminator.
std::optional<std::pair<size_t, size_t>> find_header_end(const std::string& raw) {
    size_t crlf = raw.find("\r\n\r\n");
    size_t lf = raw.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos) {
        return std::nullopt;
    }
    if (lf == std::string::npos || (crlf != std::string::npos && crlf < lf)) {
        return std::make_pair(crlf, size_t{4});
    }
    return std::make_pair(lf, size_t{2});
}

size_t content_length(const std::string& headers) {
    size_t pos = 0;
    while (pos < headers.size()) {
        size_t eol = headers.find('\n', pos);
        if (eol == std::string::npos) eol = headers.size();
        std::string line = headers.substr(pos, eol - pos);
        pos = eol + 1;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(line.substr(0, colon)) != "content-length") continue;

        try {
            return static_cast<size_t>(std::stoul(line.substr(colon + 1)));
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::optional<HttpRequest> parse_http_request(const std::string& raw) {
    size_t line_end = raw.find('\n');
    std::string request_line = raw.substr(0, line_end);
    if (!request_line.empty() && request_line.back() == '\r') {
        request_line.pop_back();
    }

    size_t sp1 = request_line.find(' ');
    if (sp1 == std::string::npos) {
        return std::nullopt;
    }
    size_t sp2 = request_line.find(' ', sp1 + 1);

    HttpRequest request;
    request.method = request_line.substr(0, sp1);
    request.path = request_line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    if (request.method.empty() || request.path.empty()) {
        return std::nullopt;
    }

    size_t query = request.path.find('?');
    if (query != std::string::npos) {
        request.path.erase(query);
    }

    if (auto end = find_header_end(raw)) {
        request.body = raw.substr(end->first + end->second);
    }
    return request;
}

RequestOp route_for(const std::string& method, const std::string& path) {
    if (method == "POST" && path == "/api/insert")   return RequestOp::INSERT;
    if (method == "GET" && path == "/api/find")      return RequestOp::FIND;
    if (method == "PUT" && path == "/api/update")    return RequestOp::UPDATE;
    if (method == "DELETE" && path == "/api/delete") return RequestOp::DELETE;
    if (method == "GET" && path == "/api/tables")    return RequestOp::TABLES;
    if (method == "POST" && path == "/api/save")     return RequestOp::SAVE;
    return RequestOp::UNKNOWN;
}

std::string format_http_response(int status, const std::string& body) {
    std::string response = "HTTP/1.1 " + std::to_string(status) + " " + status_text(status) + "\r\n";
    response += "Content-Type: application/json\r\n";
    response += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += body;
    return response;
}

HttpServer::HttpServer(RequestRouter& router, HttpServerConfig config)
    : router_(router), config_(std::move(config)) {}

HttpServer::~HttpServer() {
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
}

bool HttpServer::start() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int reuse = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("Invalid listen address: {}", config_.host);
        return false;
    }

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind {}:{}: {}", config_.host, config_.port, std::strerror(errno));
        return false;
    }
    if (::listen(listen_fd_, 16) < 0) {
        spdlog::error("Failed to listen: {}", std::strerror(errno));
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    running_ = true;
    spdlog::info("Listening on {}:{}", config_.host, bound_port_);
    return true;
}

void HttpServer::run() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ret = poll(&pfd, 1, 200);
        if (ret <= 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0) {
            if (errno != EINTR && errno != EAGAIN) {
                spdlog::warn("accept failed: {}", std::strerror(errno));
            }
            continue;
        }

        serve_connection(client);
        ::close(client);
    }
    spdlog::info("HTTP server stopped");
}

std::optional<std::string> HttpServer::read_request(int fd) {
    std::string buffer;
    char chunk[4096];

    while (buffer.size() <= config_.max_request_bytes) {
        if (auto end = find_header_end(buffer)) {
            size_t body_start = end->first + end->second;
            size_t expected = content_length(buffer.substr(0, end->first));
            if (buffer.size() - body_start >= expected) {
                return buffer;
            }
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, config_.read_timeout_ms);
        if (ret <= 0) {
            spdlog::debug("Timed out reading request");
            return std::nullopt;
        }

        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            // Peer closed: whatever arrived is the request
            if (buffer.empty()) return std::nullopt;
            return buffer;
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }

    spdlog::warn("Request exceeds {} bytes", config_.max_request_bytes);
    return std::nullopt;
}

void HttpServer::serve_connection(int fd) {
    auto raw = read_request(fd);
    std::string response;

    if (!raw) {
        response = format_http_response(400, to_wire(error_response("incomplete or oversized request")));
    } else if (auto request = parse_http_request(*raw)) {
        response = handle_request(*request);
    } else {
        response = format_http_response(400, to_wire(error_response("malformed request line")));
    }

    if (!send_all(fd, response)) {
        spdlog::debug("Client went away before response was sent");
    }
}

std::string HttpServer::handle_request(const HttpRequest& request) {
    RequestOp op = route_for(request.method, request.path);
    if (op == RequestOp::UNKNOWN) {
        spdlog::debug("No route for {} {}", request.method, request.path);
        return format_http_response(404, to_wire(error_response("unsupported endpoint", "NOT_FOUND")));
    }

    json envelope = json::object();
    if (!request.body.empty()) {
        try {
            envelope = json::parse(request.body);
        } catch (const json::parse_error& e) {
            return format_http_response(400, to_wire(error_response(std::string("JSON parse error: ") + e.what())));
        }
        if (!envelope.is_object()) {
            return format_http_response(400, to_wire(error_response("request body must be a JSON object")));
        }
    }

    envelope["op"] = request_op_to_string(op);
    json response = router_.handle(envelope);
    return format_http_response(200, to_wire(response));
}

} // namespace tabula::server
