#pragma once

#include <string>
#include <functional>
#include <map>
#include <mutex>
#include <atomic>
#include <condition_variable>

namespace flagrun {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup, empty when absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
    }

    // {"detail": message} with the given status
    static HttpResponse error(int status_code, const std::string& detail);
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection
class HttpServer {
public:
    explicit HttpServer(int port);
    ~HttpServer();

    // Register route handlers (exact method + path match)
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server (blocks until stop()). Returns at once if stop() came first.
    void start();

    // Stop accepting; in-flight connections finish on their own threads.
    // The destructor waits for them.
    void stop();

    // Port actually bound (useful with port 0)
    int port() const { return port_; }

    // Block until start() has bound the socket or failed
    bool wait_until_listening(int timeout_ms) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static const char* status_text(int status_code);

private:
    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    bool listen_attempted_ = false;
    bool stop_requested_ = false;
    int active_connections_ = 0;

    void handle_client(int client_fd, const std::string& client_ip);
    HttpResponse dispatch(const HttpRequest& req) const;
};

// Header name comparison ignoring ASCII case
bool iequals(const std::string& a, const std::string& b);

} // namespace flagrun
