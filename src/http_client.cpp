#include "flagrun/http_client.h"
#include "flagrun/constants.h"
#include "flagrun/http_server.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace flagrun {

namespace {

using Clock = std::chrono::steady_clock;

// Closes the descriptor on scope exit
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) close(fd_); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }
    int release() { int fd = fd_; fd_ = -1; return fd; }

private:
    int fd_;
};

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Wait for `events` on fd until the deadline
void wait_for(int fd, short events, Clock::time_point deadline, const std::string& what) {
    while (true) {
        int timeout = remaining_ms(deadline);
        if (timeout == 0) {
            throw HttpTimeoutError("Timed out while " + what);
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, timeout);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw HttpConnectionError("poll failed while " + what + ": " + std::strerror(errno));
        }
        if (rc == 0) {
            throw HttpTimeoutError("Timed out while " + what);
        }
        return;
    }
}

int connect_with_deadline(const Url& url, Clock::time_point deadline) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(url.port);
    int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw HttpConnectionError("Cannot resolve " + url.host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        SocketGuard sock(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.get() < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        fcntl(sock.get(), F_SETFL, fcntl(sock.get(), F_GETFL, 0) | O_NONBLOCK);

        if (connect(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                last_error = std::strerror(errno);
                continue;
            }
            try {
                wait_for(sock.get(), POLLOUT, deadline, "connecting to " + url.host);
            } catch (...) {
                freeaddrinfo(result);
                throw;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                last_error = std::strerror(so_error);
                continue;
            }
        }
        freeaddrinfo(result);
        return sock.release();
    }

    freeaddrinfo(result);
    throw HttpConnectionError("Cannot connect to " + url.host + ":" + port + ": " + last_error);
}

// Chunk size line without its extension
size_t parse_chunk_size(std::string size_line) {
    size_t ext = size_line.find(';');
    if (ext != std::string::npos) size_line.resize(ext);
    try {
        return std::stoul(size_line, nullptr, 16);
    } catch (const std::exception&) {
        throw HttpConnectionError("Malformed chunk size in response");
    }
}

// Decodes a chunked body. Returns false if more data is needed.
bool decode_chunked(const std::string& data, std::string& out) {
    out.clear();
    size_t pos = 0;
    while (true) {
        size_t line_end = data.find("\r\n", pos);
        if (line_end == std::string::npos) return false;

        size_t chunk_size = parse_chunk_size(data.substr(pos, line_end - pos));
        pos = line_end + 2;
        if (chunk_size == 0) {
            // Trailers end with an empty line
            return data.find("\r\n", pos) != std::string::npos;
        }
        if (data.size() < pos + chunk_size + 2) return false;
        out.append(data, pos, chunk_size);
        pos += chunk_size + 2;
    }
}

std::string find_header(const std::map<std::string, std::string>& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return "";
}

std::map<std::string, std::string> parse_headers(const std::string& head, int& status_code) {
    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    // HTTP/1.1 200 OK
    size_t space = line.find(' ');
    if (line.compare(0, 5, "HTTP/") != 0 || space == std::string::npos) {
        throw HttpConnectionError("Malformed status line: " + line);
    }
    try {
        status_code = std::stoi(line.substr(space + 1, 3));
    } catch (const std::exception&) {
        throw HttpConnectionError("Malformed status line: " + line);
    }

    std::map<std::string, std::string> headers;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        size_t value_start = line.find_first_not_of(" \t", colon + 1);
        headers[line.substr(0, colon)] =
            value_start == std::string::npos ? "" : line.substr(value_start);
    }
    return headers;
}

} // namespace

Url Url::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("Only http:// URLs are supported: " + url);
    }

    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    Url parsed;
    parsed.path = slash == std::string::npos ? "" : rest.substr(slash);
    while (!parsed.path.empty() && parsed.path.back() == '/') parsed.path.pop_back();

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        try {
            parsed.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port in URL: " + url);
        }
        if (parsed.port <= 0 || parsed.port > 65535) {
            throw std::invalid_argument("Invalid port in URL: " + url);
        }
    } else {
        parsed.host = authority;
    }

    if (parsed.host.empty()) {
        throw std::invalid_argument("Missing host in URL: " + url);
    }
    return parsed;
}

HttpClient::HttpClient(const std::string& base_url) : base_(Url::parse(base_url)) {}

HttpClientResponse HttpClient::get(const std::string& path, std::chrono::milliseconds timeout) const {
    return request("GET", path, "", "", timeout);
}

HttpClientResponse HttpClient::post_json(const std::string& path, const std::string& body,
                                         std::chrono::milliseconds timeout) const {
    return request("POST", path, body, "application/json", timeout);
}

HttpClientResponse HttpClient::request(const std::string& method, const std::string& path,
                                       const std::string& body, const std::string& content_type,
                                       std::chrono::milliseconds timeout) const {
    auto deadline = Clock::now() + timeout;
    SocketGuard sock(connect_with_deadline(base_, deadline));

    std::ostringstream req;
    req << method << " " << base_.path << path << " HTTP/1.1\r\n"
        << "Host: " << base_.host << ":" << base_.port << "\r\n"
        << "Accept: application/json\r\n"
        << "Connection: close\r\n";
    if (!content_type.empty()) {
        req << "Content-Type: " << content_type << "\r\n";
    }
    if (!body.empty() || method == "POST" || method == "PUT") {
        req << "Content-Length: " << body.size() << "\r\n";
    }
    req << "\r\n" << body;
    std::string data = req.str();

    size_t sent = 0;
    while (sent < data.size()) {
        wait_for(sock.get(), POLLOUT, deadline, "sending request");
        ssize_t n = send(sock.get(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            throw HttpConnectionError(std::string("Send failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }

    HttpResponseReader reader;
    char buffer[PIPE_BUFFER_SIZE];
    while (!reader.complete()) {
        wait_for(sock.get(), POLLIN, deadline, "waiting for response");
        ssize_t n = recv(sock.get(), buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            throw HttpConnectionError(std::string("Receive failed: ") + std::strerror(errno));
        }
        if (n == 0) break;  // peer closed
        reader.append(buffer, static_cast<size_t>(n));
        if (reader.raw().size() > MAX_RESPONSE_SIZE) {
            throw HttpConnectionError("Response exceeds size limit");
        }
    }

    if (reader.raw().empty()) {
        throw HttpConnectionError("Connection closed without a response");
    }
    return parse_response(reader.raw());
}

bool HttpClient::response_complete(const std::string& raw) {
    HttpResponseReader reader;
    return reader.append(raw.data(), raw.size());
}

// ============================================================================
// HttpResponseReader
// ============================================================================

bool HttpResponseReader::append(const char* data, size_t size) {
    // The header terminator may straddle two reads
    size_t scan_from = raw_.size() >= 3 ? raw_.size() - 3 : 0;
    raw_.append(data, size);
    if (complete_) return true;

    if (framing_ == Framing::UNKNOWN) {
        size_t header_end = raw_.find("\r\n\r\n", scan_from);
        if (header_end == std::string::npos) return false;
        body_start_ = header_end + 4;
        read_framing();
    }

    switch (framing_) {
        case Framing::CONTENT_LENGTH:
            complete_ = raw_.size() - body_start_ >= content_length_;
            break;
        case Framing::CHUNKED:
            complete_ = advance_chunks();
            break;
        case Framing::EMPTY:
            complete_ = true;
            break;
        case Framing::UNTIL_CLOSE:
        case Framing::UNKNOWN:
            break;
    }
    return complete_;
}

void HttpResponseReader::read_framing() {
    int status_code = 0;
    auto headers = parse_headers(raw_.substr(0, body_start_ - 4), status_code);

    if (find_header(headers, "Transfer-Encoding").find("chunked") != std::string::npos) {
        framing_ = Framing::CHUNKED;
        next_chunk_ = body_start_;
        return;
    }

    std::string length = find_header(headers, "Content-Length");
    if (!length.empty()) {
        try {
            content_length_ = std::stoul(length);
        } catch (const std::exception&) {
            throw HttpConnectionError("Malformed Content-Length: " + length);
        }
        framing_ = Framing::CONTENT_LENGTH;
        return;
    }

    // No framing: body ends when the peer closes
    bool bodiless = status_code == 204 || status_code == 304 ||
                    (status_code >= 100 && status_code < 200);
    framing_ = bodiless ? Framing::EMPTY : Framing::UNTIL_CLOSE;
}

bool HttpResponseReader::advance_chunks() {
    while (true) {
        size_t line_end = raw_.find("\r\n", next_chunk_);
        if (line_end == std::string::npos) return false;

        size_t chunk_size = parse_chunk_size(raw_.substr(next_chunk_, line_end - next_chunk_));
        size_t data_start = line_end + 2;
        if (chunk_size == 0) {
            // Trailers end with an empty line
            return raw_.find("\r\n", data_start) != std::string::npos;
        }
        if (raw_.size() < data_start + chunk_size + 2) return false;
        next_chunk_ = data_start + chunk_size + 2;
    }
}

HttpClientResponse HttpClient::parse_response(const std::string& raw) {
    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw HttpConnectionError("Truncated response headers");
    }

    HttpClientResponse resp;
    resp.headers = parse_headers(raw.substr(0, header_end), resp.status_code);
    std::string body = raw.substr(header_end + 4);

    if (find_header(resp.headers, "Transfer-Encoding").find("chunked") != std::string::npos) {
        if (!decode_chunked(body, resp.body)) {
            throw HttpConnectionError("Truncated chunked response body");
        }
        return resp;
    }

    std::string length = find_header(resp.headers, "Content-Length");
    if (!length.empty()) {
        size_t expected = 0;
        try {
            expected = std::stoul(length);
        } catch (const std::exception&) {
            throw HttpConnectionError("Malformed Content-Length: " + length);
        }
        if (body.size() < expected) {
            throw HttpConnectionError("Truncated response body");
        }
        body.resize(expected);
    }

    resp.body = std::move(body);
    return resp;
}

} // namespace flagrun
