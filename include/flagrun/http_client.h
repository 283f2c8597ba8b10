#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

namespace flagrun {

// No complete response before the deadline
class HttpTimeoutError : public std::runtime_error {
public:
    explicit HttpTimeoutError(const std::string& message)
        : std::runtime_error(message) {}
};

// Name resolution, connect, reset or unparseable response
class HttpConnectionError : public std::runtime_error {
public:
    explicit HttpConnectionError(const std::string& message)
        : std::runtime_error(message) {}
};

struct HttpClientResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Accumulates a response as it arrives. Headers are parsed once and the
// framing (Content-Length, chunked, or until close) is tracked as bytes
// come in. Throws HttpConnectionError on malformed headers or chunk sizes.
class HttpResponseReader {
public:
    // Returns true once the response is complete
    bool append(const char* data, size_t size);

    bool complete() const { return complete_; }
    const std::string& raw() const { return raw_; }

private:
    enum class Framing { UNKNOWN, CONTENT_LENGTH, CHUNKED, EMPTY, UNTIL_CLOSE };

    void read_framing();
    bool advance_chunks();

    std::string raw_;
    Framing framing_ = Framing::UNKNOWN;
    size_t body_start_ = 0;
    size_t content_length_ = 0;
    size_t next_chunk_ = 0;  // offset of the next chunk-size line
    bool complete_ = false;
};

// http://host[:port][/prefix]
struct Url {
    std::string host;
    int port = 80;
    std::string path;  // prefix without trailing slash, may be empty

    // Throws std::invalid_argument for anything but plain http URLs
    static Url parse(const std::string& url);
};

// Minimal blocking HTTP/1.1 client (Connection: close per request)
class HttpClient {
public:
    explicit HttpClient(const std::string& base_url);

    HttpClientResponse get(const std::string& path, std::chrono::milliseconds timeout) const;
    HttpClientResponse post_json(const std::string& path, const std::string& body,
                                 std::chrono::milliseconds timeout) const;

    HttpClientResponse request(const std::string& method, const std::string& path,
                               const std::string& body, const std::string& content_type,
                               std::chrono::milliseconds timeout) const;

    const Url& base() const { return base_; }

    // Parses status line, headers and (chunked or sized) body.
    // Throws HttpConnectionError when the response is malformed or truncated.
    static HttpClientResponse parse_response(const std::string& raw);

    // True once `raw` holds a complete response
    static bool response_complete(const std::string& raw);

private:
    Url base_;
};

} // namespace flagrun
