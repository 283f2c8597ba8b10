#include "flagrun/http_server.h"
#include "flagrun/constants.h"

#include <json/json.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace flagrun {

namespace {

bool write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Content-Length of a raw header block, npos when absent or malformed
size_t content_length_of(const std::string& headers) {
    std::istringstream stream(headers);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (!iequals(line.substr(0, colon), "Content-Length")) continue;

        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        if (start == std::string::npos) return std::string::npos;
        try {
            return std::stoul(value.substr(start));
        } catch (const std::exception&) {
            return std::string::npos;
        }
    }
    return std::string::npos;
}

} // namespace

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string HttpRequest::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return "";
}

HttpResponse HttpResponse::error(int status_code, const std::string& detail) {
    HttpResponse resp;
    resp.status_code = status_code;

    Json::Value json;
    json["detail"] = detail;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    resp.body = Json::writeString(builder, json);
    return resp;
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();

    // Connection threads hold `this`
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this] { return active_connections_ == 0; });
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

bool HttpServer::wait_until_listening(int timeout_ms) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                       [this] { return listen_attempted_; });
    return running_;
}

void HttpServer::start() {
    auto fail = [this](const std::string& message) {
        if (server_fd_ >= 0) {
            close(server_fd_);
            server_fd_ = -1;
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            listen_attempted_ = true;
        }
        state_cv_.notify_all();
        throw std::runtime_error(message);
    };

    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        fail("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        fail("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        fail("Failed to listen");
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(server_fd_, (struct sockaddr*)&addr, &addr_len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    bool stopped_early;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        listen_attempted_ = true;
        stopped_early = stop_requested_;
        if (stopped_early) {
            close(server_fd_);
            server_fd_ = -1;
        } else {
            running_ = true;
        }
    }
    state_cv_.notify_all();
    if (stopped_early) return;
    std::cout << "Server listening on port " << port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        // Get client IP
        char ip_buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_buf, sizeof(ip_buf));
        std::string client_ip = ip_buf;

        // Handle in new thread (simple concurrency)
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            active_connections_++;
        }
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
            std::lock_guard<std::mutex> lock(state_mutex_);
            active_connections_--;
            state_cv_.notify_all();
        }).detach();
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    close(server_fd_);
    server_fd_ = -1;
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_requested_ = true;
    running_ = false;
    if (server_fd_ >= 0) {
        // Wakes a thread blocked in accept(); start() closes the socket
        shutdown(server_fd_, SHUT_RDWR);
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    // Read request with size limit
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;

    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        if (request_data.size() + bytes_read > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(HttpResponse::error(413, "Request exceeds size limit")));
            return;
        }

        request_data.append(buffer, bytes_read);

        // Check if we've received the complete headers
        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) continue;

        size_t content_length = content_length_of(request_data.substr(0, header_end));
        if (content_length == std::string::npos) {
            // No Content-Length, assume request is complete
            break;
        }

        size_t expected_size = header_end + 4 + content_length;
        if (expected_size > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(HttpResponse::error(413, "Request exceeds size limit")));
            return;
        }

        // Read remaining body if needed
        while (request_data.size() < expected_size) {
            bytes_read = read(client_fd, buffer,
                std::min(sizeof(buffer), expected_size - request_data.size()));
            if (bytes_read <= 0) break;
            request_data.append(buffer, bytes_read);
        }
        break;
    }

    if (request_data.empty()) return;

    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp = dispatch(req);
    if (!write_all(client_fd, build_response(resp))) {
        std::cerr << "Failed to write response to " << client_ip << std::endl;
    }
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    if (req.method.empty()) {
        return HttpResponse::error(400, "Malformed request line");
    }

    // Strip query string for routing
    std::string path = req.path.substr(0, req.path.find('?'));
    auto it = routes_.find(req.method + " " + path);
    if (it == routes_.end()) {
        // Known path with another method
        for (const auto& [pattern, handler] : routes_) {
            if (pattern.substr(pattern.find(' ') + 1) == path) {
                return HttpResponse::error(405, "Method not allowed");
            }
        }
        return HttpResponse::error(404, "Not found");
    }

    try {
        return it->second(req);
    } catch (const std::exception& e) {
        std::cerr << "Handler for " << req.method << " " << path
                  << " failed: " << e.what() << std::endl;
        return HttpResponse::error(500, std::string("Internal error: ") + e.what());
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = raw.substr(0, header_end);
    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            size_t value_start = line.find_first_not_of(" \t", colon + 1);
            std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
            req.headers[key] = value;
        }
    }

    // Rest is body, bounded by Content-Length when given
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
        size_t content_length = content_length_of(head);
        if (content_length != std::string::npos && req.body.size() > content_length) {
            req.body.resize(content_length);
        }
    }

    return req;
}

const char* HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace flagrun
