#include "flagrun/amqp_client.h"

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace flagrun {

namespace {

using Clock = std::chrono::steady_clock;

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch()).count();
}

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

int connect_socket(const std::string& host, int port, Clock::time_point deadline) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0) {
        throw std::runtime_error("Cannot resolve broker host " + host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        bool connected = connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
        if (!connected && errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, remaining_ms(deadline));
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (ready > 0 && getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                connected = true;
            } else {
                last_error = ready == 0 ? "connect timed out" : std::strerror(so_error ? so_error : errno);
            }
        } else if (!connected) {
            last_error = std::strerror(errno);
        }

        if (!connected) {
            ::close(fd);
            continue;
        }

        // Back to blocking mode with bounded writes
        fcntl(fd, F_SETFL, flags);
        struct timeval tv;
        tv.tv_sec = AMQP_RPC_TIMEOUT_MS / 1000;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        int one = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        freeaddrinfo(result);
        return fd;
    }

    freeaddrinfo(result);
    throw std::runtime_error("Cannot connect to broker at " + host + ":" + port_str + ": " + last_error);
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw AmqpError(std::string("Broker write failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

} // namespace

// ============================================================================
// AmqpConnection
// ============================================================================

AmqpConnection::AmqpConnection(const BrokerConfig& config) : config_(config) {}

AmqpConnection::~AmqpConnection() {
    close();
}

std::string AmqpConnection::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void AmqpConnection::open() {
    auto deadline = Clock::now() + std::chrono::milliseconds(AMQP_RPC_TIMEOUT_MS);
    fd_ = connect_socket(config_.host, config_.port, deadline);
    read_buffer_.clear();

    try {
        write_all(fd_, AMQP_PROTOCOL_HEADER);

        // connection.start: version, server-properties, mechanisms, locales
        AmqpMethod start = expect_method(amqp_method::CONNECTION_START, deadline);
        AmqpReader start_args(start.args);
        start_args.octet();
        start_args.octet();
        start_args.skip_table();
        std::string mechanisms = start_args.longstr();
        if (mechanisms.find("PLAIN") == std::string::npos) {
            throw AmqpError("Broker does not offer PLAIN authentication (" + mechanisms + ")");
        }

        AmqpWriter start_ok;
        start_ok.table({{"product", "flagrun"},
                        {"platform", "C++"},
                        {"information", "code execution scheduler/feeder"}})
                .shortstr("PLAIN")
                .longstr(std::string(1, '\0') + config_.user + std::string(1, '\0') + config_.password)
                .shortstr("en_US");
        write_all(fd_, encode_frame({AmqpFrameType::METHOD, 0,
                                     encode_method(amqp_method::CONNECTION_START_OK, start_ok)}));

        // connection.tune: channel-max, frame-max, heartbeat
        AmqpMethod tune = expect_method(amqp_method::CONNECTION_TUNE, deadline);
        AmqpReader tune_args(tune.args);
        channel_max_ = tune_args.short_uint();
        uint32_t server_frame_max = tune_args.long_uint();
        uint16_t server_heartbeat = tune_args.short_uint();

        frame_max_ = AMQP_DEFAULT_FRAME_MAX;
        if (server_frame_max != 0 && server_frame_max < frame_max_) {
            frame_max_ = server_frame_max;
        }
        auto wanted = static_cast<uint16_t>(config_.heartbeat_seconds);
        if (wanted == 0 || server_heartbeat == 0) {
            heartbeat_ = std::max(wanted, server_heartbeat);
        } else {
            heartbeat_ = std::min(wanted, server_heartbeat);
        }

        AmqpWriter tune_ok;
        tune_ok.short_uint(channel_max_)
               .long_uint(static_cast<uint32_t>(frame_max_))
               .short_uint(heartbeat_);
        write_all(fd_, encode_frame({AmqpFrameType::METHOD, 0,
                                     encode_method(amqp_method::CONNECTION_TUNE_OK, tune_ok)}));

        AmqpWriter open_args;
        open_args.shortstr(config_.vhost).shortstr("").bits({false});
        write_all(fd_, encode_frame({AmqpFrameType::METHOD, 0,
                                     encode_method(amqp_method::CONNECTION_OPEN, open_args)}));
        expect_method(amqp_method::CONNECTION_OPEN_OK, deadline);
    } catch (...) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_.clear();
        close_ok_received_ = false;
    }
    stopping_ = false;
    open_ = true;
    last_write_ms_ = now_ms();
    io_thread_ = std::thread(&AmqpConnection::io_loop, this);

    std::cout << "[AMQP] Connected to " << config_.host << ":" << config_.port
              << " vhost=" << config_.vhost << " heartbeat=" << heartbeat_ << "s"
              << " frame_max=" << frame_max_ << std::endl;
}

AmqpFrame AmqpConnection::read_frame_blocking(Clock::time_point deadline) {
    char buffer[PIPE_BUFFER_SIZE];
    while (true) {
        AmqpFrame frame;
        size_t consumed = decode_frame(read_buffer_, frame);
        if (consumed > 0) {
            read_buffer_.erase(0, consumed);
            return frame;
        }
        // A protocol header in reply means the broker rejected our version
        if (read_buffer_.size() >= 8 && read_buffer_.compare(0, 4, "AMQP") == 0) {
            throw AmqpError("Broker does not support AMQP 0-9-1");
        }

        int timeout = remaining_ms(deadline);
        if (timeout == 0) {
            throw AmqpError("Timed out during broker handshake");
        }
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, timeout);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw AmqpError(std::string("poll failed during handshake: ") + std::strerror(errno));
        }
        if (rc == 0) continue;

        ssize_t n = recv(fd_, buffer, sizeof(buffer), 0);
        if (n == 0) {
            throw AmqpError("Broker closed the connection during handshake (check credentials and vhost)");
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw AmqpError(std::string("Broker read failed: ") + std::strerror(errno));
        }
        read_buffer_.append(buffer, n);
    }
}

AmqpMethod AmqpConnection::expect_method(AmqpMethodId expected, Clock::time_point deadline) {
    while (true) {
        AmqpFrame frame = read_frame_blocking(deadline);
        if (frame.type == AmqpFrameType::HEARTBEAT) continue;
        if (frame.type != AmqpFrameType::METHOD) {
            throw AmqpError("Unexpected content frame during handshake");
        }

        AmqpMethod method = decode_method(frame.payload);
        if (method.id == amqp_method::CONNECTION_CLOSE) {
            uint16_t code = 0;
            std::string reason = describe_close(method, &code);
            throw AmqpError("Broker refused connection: " + reason, code);
        }
        if (method.id != expected) {
            throw AmqpError("Unexpected method " + std::to_string(method.id.class_id) + "." +
                            std::to_string(method.id.method_id) + " during handshake");
        }
        return method;
    }
}

void AmqpConnection::close() {
    if (!io_thread_.joinable() && fd_ < 0) {
        return;
    }

    if (open_) {
        try {
            AmqpWriter args;
            args.short_uint(AMQP_REPLY_SUCCESS).shortstr("Normal shutdown").short_uint(0).short_uint(0);
            send_method(0, amqp_method::CONNECTION_CLOSE, args);

            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::seconds(2),
                         [this] { return close_ok_received_ || !open_; });
        } catch (const std::exception& e) {
            std::cerr << "[AMQP] Close handshake failed: " << e.what() << std::endl;
        }
    }

    stopping_ = true;
    open_ = false;
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_RDWR);
    }
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    {
        std::lock_guard<std::mutex> write_lock(write_mutex_);
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, state] : channels_) {
        if (!state.closed) {
            state.closed = true;
            state.close_reason = "Connection closed";
        }
    }
    if (error_.empty()) error_ = "Connection closed";
    cv_.notify_all();
}

void AmqpConnection::fail(const std::string& reason) {
    bool expected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_.empty()) return;
        // The broker drops the socket right after close-ok
        expected = close_ok_received_;
        error_ = reason;
        open_ = false;
        for (auto& [id, state] : channels_) {
            if (!state.closed) {
                state.closed = true;
                state.close_reason = reason;
            }
        }
        cv_.notify_all();
    }
    if (!stopping_ && !expected) {
        std::cerr << "[AMQP] Connection lost: " << reason << std::endl;
    }
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_RDWR);
    }
}

void AmqpConnection::send_frames(const std::vector<AmqpFrame>& frames) {
    std::string data;
    for (const auto& frame : frames) {
        data += encode_frame(frame);
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (fd_ < 0 || !open_) {
        throw AmqpError("Connection is not open");
    }
    try {
        write_all(fd_, data);
    } catch (const AmqpError& e) {
        fail(e.what());
        throw;
    }
    last_write_ms_ = now_ms();
}

void AmqpConnection::send_method(uint16_t channel, AmqpMethodId id, const AmqpWriter& args) {
    send_frames({{AmqpFrameType::METHOD, channel, encode_method(id, args)}});
}

AmqpMethod AmqpConnection::rpc(uint16_t channel, AmqpMethodId id, const AmqpWriter& args,
                               AmqpMethodId expected) {
    send_method(channel, id, args);

    std::unique_lock<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    if (it == channels_.end()) {
        throw AmqpError("Unknown channel " + std::to_string(channel));
    }
    ChannelState& state = it->second;

    cv_.wait_for(lock, std::chrono::milliseconds(AMQP_RPC_TIMEOUT_MS), [&] {
        return !state.replies.empty() || state.closed || !open_;
    });

    if (!state.replies.empty()) {
        AmqpMethod reply = std::move(state.replies.front());
        state.replies.pop_front();
        if (reply.id != expected) {
            throw AmqpError("Unexpected reply " + std::to_string(reply.id.class_id) + "." +
                            std::to_string(reply.id.method_id) + " on channel " +
                            std::to_string(channel));
        }
        return reply;
    }
    if (state.closed) {
        throw AmqpError("Channel " + std::to_string(channel) + " closed: " + state.close_reason);
    }
    if (!open_) {
        throw AmqpError("Connection lost: " + error_);
    }
    throw AmqpError("Timed out waiting for broker reply on channel " + std::to_string(channel));
}

std::unique_ptr<AmqpChannel> AmqpConnection::open_channel() {
    uint16_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            throw AmqpError("Connection is not open");
        }
        uint16_t limit = channel_max_ == 0 ? 65535 : channel_max_;
        for (uint16_t tries = 0; tries < limit; ++tries) {
            uint16_t candidate = next_channel_;
            next_channel_ = next_channel_ >= limit ? 1 : next_channel_ + 1;
            if (channels_.count(candidate) == 0) {
                id = candidate;
                break;
            }
        }
        if (id == 0) {
            throw AmqpError("No free channel ids");
        }
        channels_.emplace(id, ChannelState());
    }

    try {
        AmqpWriter args;
        args.shortstr("");
        rpc(id, amqp_method::CHANNEL_OPEN, args, amqp_method::CHANNEL_OPEN_OK);
    } catch (...) {
        release_channel(id);
        throw;
    }
    return std::make_unique<AmqpChannel>(*this, id);
}

void AmqpConnection::release_channel(uint16_t channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(channel);
}

uint64_t AmqpConnection::publish(uint16_t channel, const std::string& queue, const std::string& body) {
    auto frames = encode_publish(channel, queue, body, "application/json", frame_max_);
    std::string data;
    for (const auto& frame : frames) {
        data += encode_frame(frame);
    }

    // Sequence numbers must follow wire order, so assign under the write lock
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_ || fd_ < 0) {
            throw AmqpError("Connection is not open");
        }
        auto it = channels_.find(channel);
        if (it == channels_.end() || it->second.closed) {
            throw AmqpError("Channel " + std::to_string(channel) + " is closed");
        }
        if (it->second.confirms) {
            seq = it->second.next_publish_seq++;
            it->second.unconfirmed.insert(seq);
        }
    }
    try {
        write_all(fd_, data);
    } catch (const AmqpError& e) {
        fail(e.what());
        throw;
    }
    last_write_ms_ = now_ms();
    return seq;
}

void AmqpConnection::wait_confirm(uint16_t channel, uint64_t seq) {
    if (seq == 0) return;

    std::unique_lock<std::mutex> lock(mutex_);
    auto it = channels_.find(channel);
    if (it == channels_.end()) {
        throw AmqpError("Channel " + std::to_string(channel) + " is closed");
    }
    ChannelState& state = it->second;

    cv_.wait_for(lock, std::chrono::milliseconds(AMQP_RPC_TIMEOUT_MS), [&] {
        return state.unconfirmed.count(seq) == 0 || state.closed || !open_;
    });

    if (state.unconfirmed.count(seq) == 0) {
        if (state.nacked.erase(seq) > 0) {
            throw AmqpError("Broker rejected message " + std::to_string(seq));
        }
        return;
    }
    state.unconfirmed.erase(seq);
    if (state.closed || !open_) {
        throw AmqpError("Channel closed before the broker confirmed the message");
    }
    throw AmqpError("Timed out waiting for publish confirmation");
}

void AmqpConnection::io_loop() {
    char buffer[PIPE_BUFFER_SIZE];
    int64_t last_read = now_ms();
    const int64_t heartbeat_ms = static_cast<int64_t>(heartbeat_) * 1000;

    while (open_ && !stopping_) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            fail(std::string("poll failed: ") + std::strerror(errno));
            break;
        }

        if (rc > 0) {
            ssize_t n = recv(fd_, buffer, sizeof(buffer), 0);
            if (n == 0) {
                fail("Connection closed by broker");
                break;
            }
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                fail(std::string("Broker read failed: ") + std::strerror(errno));
                break;
            }
            read_buffer_.append(buffer, n);
            last_read = now_ms();

            try {
                AmqpFrame frame;
                size_t consumed;
                while ((consumed = decode_frame(read_buffer_, frame)) > 0) {
                    read_buffer_.erase(0, consumed);
                    handle_frame(frame);
                }
            } catch (const AmqpError& e) {
                fail(std::string("Protocol error: ") + e.what());
                break;
            }
        }

        if (heartbeat_ms > 0) {
            int64_t now = now_ms();
            if (now - last_read > 2 * heartbeat_ms) {
                fail("Missed broker heartbeats");
                break;
            }
            if (now - last_write_ms_ >= heartbeat_ms / 2) {
                try {
                    send_frames({{AmqpFrameType::HEARTBEAT, 0, ""}});
                } catch (const AmqpError&) {
                    break;  // send_frames already failed the connection
                }
            }
        }
    }
}

void AmqpConnection::handle_frame(const AmqpFrame& frame) {
    switch (frame.type) {
        case AmqpFrameType::HEARTBEAT:
            return;

        case AmqpFrameType::METHOD:
            handle_method(frame.channel, decode_method(frame.payload));
            return;

        case AmqpFrameType::HEADER:
        case AmqpFrameType::BODY: {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = channels_.find(frame.channel);
            if (it == channels_.end() || !it->second.assembling) {
                return;
            }
            ChannelState& state = it->second;
            if (frame.type == AmqpFrameType::HEADER) {
                if (!state.awaiting_header) {
                    throw AmqpError("Unexpected content header");
                }
                state.awaiting_header = false;
                state.expected_size = decode_content_body_size(frame.payload);
            } else {
                if (state.awaiting_header) {
                    throw AmqpError("Content body before header");
                }
                state.pending.body += frame.payload;
            }

            if (!state.awaiting_header && state.pending.body.size() >= state.expected_size) {
                state.deliveries.push_back(std::move(state.pending));
                state.pending = Delivery();
                state.assembling = false;
                cv_.notify_all();
            }
            return;
        }
    }
}

void AmqpConnection::handle_method(uint16_t channel, const AmqpMethod& method) {
    if (channel == 0) {
        if (method.id == amqp_method::CONNECTION_CLOSE) {
            std::string reason = describe_close(method);
            try {
                send_method(0, amqp_method::CONNECTION_CLOSE_OK, AmqpWriter());
            } catch (const AmqpError&) {
                // connection is going away regardless
            }
            fail("Broker closed connection: " + reason);
        } else if (method.id == amqp_method::CONNECTION_CLOSE_OK) {
            std::lock_guard<std::mutex> lock(mutex_);
            close_ok_received_ = true;
            cv_.notify_all();
        }
        return;
    }

    bool send_close_ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(channel);
        if (it == channels_.end()) {
            return;
        }
        ChannelState& state = it->second;

        if (method.id == amqp_method::BASIC_DELIVER) {
            AmqpReader args(method.args);
            args.shortstr();  // consumer-tag
            state.pending = Delivery();
            state.pending.delivery_tag = args.longlong_uint();
            args.octet();
            state.pending.redelivered = args.bit(0);
            state.assembling = true;
            state.awaiting_header = true;
            state.expected_size = 0;
        } else if (state.confirms && method.id == amqp_method::BASIC_ACK) {
            handle_confirm(state, method, true);
        } else if (state.confirms && method.id == amqp_method::BASIC_NACK) {
            handle_confirm(state, method, false);
        } else if (method.id == amqp_method::CHANNEL_CLOSE) {
            state.closed = true;
            state.close_reason = describe_close(method);
            send_close_ok = true;
            std::cerr << "[AMQP] Channel " << channel << " closed by broker: "
                      << state.close_reason << std::endl;
        } else if (method.id == amqp_method::BASIC_CANCEL) {
            state.closed = true;
            state.close_reason = "Consumer cancelled by broker";
        } else {
            state.replies.push_back(method);
        }
        cv_.notify_all();
    }

    if (send_close_ok) {
        send_method(channel, amqp_method::CHANNEL_CLOSE_OK, AmqpWriter());
    }
}

void AmqpConnection::handle_confirm(ChannelState& state, const AmqpMethod& method, bool positive) {
    AmqpReader args(method.args);
    uint64_t tag = args.longlong_uint();
    args.octet();
    bool multiple = args.bit(0);

    auto settle = [&](uint64_t seq) {
        if (!positive) state.nacked.insert(seq);
    };

    if (multiple) {
        auto end = state.unconfirmed.upper_bound(tag);
        for (auto it = state.unconfirmed.begin(); it != end; ++it) {
            settle(*it);
        }
        state.unconfirmed.erase(state.unconfirmed.begin(), end);
    } else if (state.unconfirmed.erase(tag) > 0) {
        settle(tag);
    }
}

// ============================================================================
// AmqpChannel
// ============================================================================

AmqpChannel::AmqpChannel(AmqpConnection& connection, uint16_t id)
    : connection_(connection), id_(id) {}

AmqpChannel::~AmqpChannel() {
    close();
}

void AmqpChannel::declare_queue(const std::string& name, bool durable) {
    AmqpWriter args;
    args.short_uint(0)
        .shortstr(name)
        .bits({false, durable, false, false, false})  // passive, durable, exclusive, auto-delete, no-wait
        .table({});
    connection_.rpc(id_, amqp_method::QUEUE_DECLARE, args, amqp_method::QUEUE_DECLARE_OK);
}

void AmqpChannel::set_prefetch(uint16_t count) {
    AmqpWriter args;
    args.long_uint(0).short_uint(count).bits({false});
    connection_.rpc(id_, amqp_method::BASIC_QOS, args, amqp_method::BASIC_QOS_OK);
}

void AmqpChannel::enable_confirms() {
    AmqpWriter args;
    args.bits({false});
    connection_.rpc(id_, amqp_method::CONFIRM_SELECT, args, amqp_method::CONFIRM_SELECT_OK);

    std::lock_guard<std::mutex> lock(connection_.mutex_);
    auto it = connection_.channels_.find(id_);
    if (it != connection_.channels_.end()) {
        it->second.confirms = true;
    }
}

std::string AmqpChannel::consume(const std::string& queue) {
    AmqpWriter args;
    args.short_uint(0)
        .shortstr(queue)
        .shortstr("")                        // broker assigns the tag
        .bits({false, false, false, false})  // no-local, no-ack, exclusive, no-wait
        .table({});
    AmqpMethod reply = connection_.rpc(id_, amqp_method::BASIC_CONSUME, args,
                                       amqp_method::BASIC_CONSUME_OK);
    AmqpReader reader(reply.args);
    return reader.shortstr();
}

std::optional<Delivery> AmqpChannel::next_delivery(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(connection_.mutex_);
    auto it = connection_.channels_.find(id_);
    if (it == connection_.channels_.end()) {
        throw AmqpError("Channel " + std::to_string(id_) + " is closed");
    }
    auto& state = it->second;

    connection_.cv_.wait_for(lock, timeout, [&] {
        return !state.deliveries.empty() || state.closed || !connection_.open_;
    });

    if (!state.deliveries.empty()) {
        Delivery delivery = std::move(state.deliveries.front());
        state.deliveries.pop_front();
        return delivery;
    }
    if (state.closed) {
        throw AmqpError("Channel " + std::to_string(id_) + " closed: " + state.close_reason);
    }
    if (!connection_.open_) {
        throw AmqpError("Connection lost: " + connection_.error_);
    }
    return std::nullopt;
}

bool AmqpChannel::is_open() const {
    if (closed_ || !connection_.is_open()) return false;
    std::lock_guard<std::mutex> lock(connection_.mutex_);
    auto it = connection_.channels_.find(id_);
    return it != connection_.channels_.end() && !it->second.closed;
}

void AmqpChannel::publish(const std::string& queue, const std::string& body) {
    uint64_t seq = connection_.publish(id_, queue, body);
    connection_.wait_confirm(id_, seq);
}

void AmqpChannel::ack(uint64_t delivery_tag) {
    AmqpWriter args;
    args.longlong_uint(delivery_tag).bits({false});
    connection_.send_method(id_, amqp_method::BASIC_ACK, args);
}

void AmqpChannel::reject(uint64_t delivery_tag, bool requeue) {
    AmqpWriter args;
    args.longlong_uint(delivery_tag).bits({requeue});
    connection_.send_method(id_, amqp_method::BASIC_REJECT, args);
}

void AmqpChannel::close() {
    if (closed_) return;
    bool live = is_open();
    closed_ = true;

    if (live) {
        try {
            AmqpWriter args;
            args.short_uint(AMQP_REPLY_SUCCESS).shortstr("Normal shutdown").short_uint(0).short_uint(0);
            connection_.rpc(id_, amqp_method::CHANNEL_CLOSE, args, amqp_method::CHANNEL_CLOSE_OK);
        } catch (const AmqpError& e) {
            std::cerr << "[AMQP] Channel " << id_ << " close failed: " << e.what() << std::endl;
        }
    }
    connection_.release_channel(id_);
}

} // namespace flagrun
