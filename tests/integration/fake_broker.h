#pragma once

/**
 * In-process AMQP 0-9-1 broker for integration tests.
 *
 * Speaks just enough of the protocol for AmqpConnection: the handshake,
 * channels, queue.declare, basic.qos/consume/publish/ack/reject and
 * publisher confirms. Messages published to a queue are delivered
 * round-robin to its consumers, or held until one appears.
 */

#include "flagrun/amqp_frame.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace flagrun {
namespace testing_support {

class FakeBroker {
public:
    struct Options {
        uint32_t frame_max = 4096;
        uint16_t heartbeat = 0;
        bool refuse_login = false;       // answer start-ok with connection.close 403
        bool nack_publishes = false;     // basic.nack instead of basic.ack
        std::string forbidden_queue;     // queue.declare on it closes the channel
    };

    FakeBroker() : FakeBroker(Options()) {}

    explicit FakeBroker(Options options) : options_(options) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");
        int opt = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(listen_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 ||
            listen(listen_fd_, 16) < 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, (struct sockaddr*)&addr, &len);
        port_ = ntohs(addr.sin_port);

        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~FakeBroker() { stop(); }

    int port() const { return port_; }

    void stop() {
        if (stopped_.exchange(true)) return;
        shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (accept_thread_.joinable()) accept_thread_.join();

        drop_connections();
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            threads.swap(connection_threads_);
        }
        for (auto& t : threads) t.join();
    }

    // Abruptly closes every client socket
    void drop_connections() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& conn : connections_) {
            shutdown(conn->fd, SHUT_RDWR);
        }
    }

    // Publish as if from another client
    void inject(const std::string& queue, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        route(queue, body);
    }

    // Every body published to `queue` so far, in order
    std::vector<std::string> published(const std::string& queue) {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_[queue];
    }

    bool wait_for_published(const std::string& queue, size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return history_[queue].size() >= count; });
    }

    bool wait_for_consumers(const std::string& queue, size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return consumer_count(queue) >= count; });
    }

    bool wait_for_acks(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return acked_ >= count; });
    }

    size_t acked() {
        std::lock_guard<std::mutex> lock(mutex_);
        return acked_;
    }

    std::vector<std::pair<uint64_t, bool>> rejected() {
        std::lock_guard<std::mutex> lock(mutex_);
        return rejected_;
    }

    std::set<std::string> declared() {
        std::lock_guard<std::mutex> lock(mutex_);
        return declared_;
    }

    std::string last_credentials() {
        std::lock_guard<std::mutex> lock(mutex_);
        return credentials_;
    }

    uint16_t last_prefetch() {
        std::lock_guard<std::mutex> lock(mutex_);
        return prefetch_;
    }

    size_t connection_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.size();
    }

private:
    struct Connection;

    struct Consumer {
        std::shared_ptr<Connection> connection;
        uint16_t channel;
        std::string tag;
    };

    struct ChannelState {
        bool confirms = false;
        uint64_t publish_seq = 0;
        uint64_t delivery_tag = 0;
        // basic.publish being assembled
        bool assembling = false;
        std::string routing_key;
        uint64_t expected = 0;
        std::string body;
    };

    struct Connection {
        int fd = -1;
        std::mutex write_mutex;
        std::map<uint16_t, ChannelState> channels;  // guarded by FakeBroker::mutex_
    };

    void accept_loop() {
        while (!stopped_) {
            int fd = accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (stopped_) return;
                continue;
            }
            auto conn = std::make_shared<Connection>();
            conn->fd = fd;
            std::lock_guard<std::mutex> lock(mutex_);
            connections_.push_back(conn);
            connection_threads_.emplace_back([this, conn] { serve(conn); });
        }
    }

    static void send_raw(Connection& conn, const std::string& data) {
        std::lock_guard<std::mutex> lock(conn.write_mutex);
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(conn.fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    static void send_method(Connection& conn, uint16_t channel, AmqpMethodId id, const AmqpWriter& args) {
        send_raw(conn, encode_frame({AmqpFrameType::METHOD, channel, encode_method(id, args)}));
    }

    size_t consumer_count(const std::string& queue) {
        auto it = consumers_.find(queue);
        return it == consumers_.end() ? 0 : it->second.size();
    }

    // Caller holds mutex_
    void route(const std::string& queue, const std::string& body) {
        history_[queue].push_back(body);
        cv_.notify_all();

        auto it = consumers_.find(queue);
        if (it == consumers_.end() || it->second.empty()) {
            backlog_[queue].push_back(body);
            return;
        }
        size_t& next = round_robin_[queue];
        Consumer& consumer = it->second[next % it->second.size()];
        ++next;
        deliver(consumer, queue, body);
    }

    // Caller holds mutex_
    void deliver(Consumer& consumer, const std::string& queue, const std::string& body) {
        ChannelState& channel = consumer.connection->channels[consumer.channel];
        uint64_t tag = ++channel.delivery_tag;

        auto frames = encode_publish(consumer.channel, queue, body, "application/json",
                                     options_.frame_max);
        AmqpWriter args;
        args.shortstr(consumer.tag).longlong_uint(tag).bits({false}).shortstr("").shortstr(queue);
        frames[0].payload = encode_method(amqp_method::BASIC_DELIVER, args);

        std::string data;
        for (const auto& frame : frames) data += encode_frame(frame);
        send_raw(*consumer.connection, data);
    }

    void forget(const std::shared_ptr<Connection>& conn) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [queue, list] : consumers_) {
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [&](const Consumer& c) { return c.connection == conn; }),
                       list.end());
        }
        connections_.erase(std::remove(connections_.begin(), connections_.end(), conn),
                           connections_.end());
        cv_.notify_all();
    }

    void serve(std::shared_ptr<Connection> conn) {
        std::string buffer;
        char chunk[4096];

        // Protocol header
        while (buffer.size() < 8) {
            ssize_t n = recv(conn->fd, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                close_connection(conn);
                return;
            }
            buffer.append(chunk, n);
        }
        buffer.erase(0, 8);

        AmqpWriter start;
        start.octet(0).octet(9).table({{"product", "FakeBroker"}}).longstr("PLAIN AMQPLAIN").longstr("en_US");
        send_method(*conn, 0, amqp_method::CONNECTION_START, start);

        bool running = true;
        while (running) {
            AmqpFrame frame;
            size_t consumed = 0;
            try {
                consumed = decode_frame(buffer, frame);
            } catch (const AmqpError&) {
                break;
            }
            if (consumed == 0) {
                ssize_t n = recv(conn->fd, chunk, sizeof(chunk), 0);
                if (n <= 0) break;
                buffer.append(chunk, n);
                continue;
            }
            buffer.erase(0, consumed);
            running = handle(conn, frame);
        }
        close_connection(conn);
    }

    void close_connection(const std::shared_ptr<Connection>& conn) {
        forget(conn);
        std::lock_guard<std::mutex> lock(conn->write_mutex);
        ::close(conn->fd);
        conn->fd = -1;
    }

    // Returns false once the connection should end
    bool handle(const std::shared_ptr<Connection>& conn, const AmqpFrame& frame) {
        if (frame.type == AmqpFrameType::HEARTBEAT) return true;

        if (frame.type == AmqpFrameType::HEADER || frame.type == AmqpFrameType::BODY) {
            std::lock_guard<std::mutex> lock(mutex_);
            ChannelState& state = conn->channels[frame.channel];
            if (!state.assembling) return true;
            if (frame.type == AmqpFrameType::HEADER) {
                state.expected = decode_content_body_size(frame.payload);
            } else {
                state.body += frame.payload;
            }
            if (state.body.size() >= state.expected) {
                state.assembling = false;
                finish_publish(*conn, frame.channel, state);
            }
            return true;
        }

        AmqpMethod method = decode_method(frame.payload);
        const AmqpMethodId& id = method.id;
        AmqpReader args(method.args);

        if (id == amqp_method::CONNECTION_START_OK) {
            args.skip_table();
            args.shortstr();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                credentials_ = args.longstr();
            }
            if (options_.refuse_login) {
                AmqpWriter close;
                close.short_uint(403).shortstr("ACCESS_REFUSED - Login was refused").short_uint(0).short_uint(0);
                send_method(*conn, 0, amqp_method::CONNECTION_CLOSE, close);
                return false;
            }
            AmqpWriter tune;
            tune.short_uint(2047).long_uint(options_.frame_max).short_uint(options_.heartbeat);
            send_method(*conn, 0, amqp_method::CONNECTION_TUNE, tune);
        } else if (id == amqp_method::CONNECTION_TUNE_OK) {
            // nothing to answer
        } else if (id == amqp_method::CONNECTION_OPEN) {
            AmqpWriter ok;
            ok.shortstr("");
            send_method(*conn, 0, amqp_method::CONNECTION_OPEN_OK, ok);
        } else if (id == amqp_method::CONNECTION_CLOSE) {
            send_method(*conn, 0, amqp_method::CONNECTION_CLOSE_OK, AmqpWriter());
            return false;
        } else if (id == amqp_method::CHANNEL_OPEN) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                conn->channels[frame.channel] = ChannelState();
            }
            AmqpWriter ok;
            ok.longstr("");
            send_method(*conn, frame.channel, amqp_method::CHANNEL_OPEN_OK, ok);
        } else if (id == amqp_method::CHANNEL_CLOSE) {
            drop_channel(conn, frame.channel);
            send_method(*conn, frame.channel, amqp_method::CHANNEL_CLOSE_OK, AmqpWriter());
        } else if (id == amqp_method::CHANNEL_CLOSE_OK) {
            drop_channel(conn, frame.channel);
        } else if (id == amqp_method::QUEUE_DECLARE) {
            args.short_uint();
            std::string queue = args.shortstr();
            if (!options_.forbidden_queue.empty() && queue == options_.forbidden_queue) {
                AmqpWriter close;
                close.short_uint(403).shortstr("ACCESS_REFUSED - queue '" + queue + "'")
                     .short_uint(50).short_uint(10);
                send_method(*conn, frame.channel, amqp_method::CHANNEL_CLOSE, close);
                return true;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                declared_.insert(queue);
            }
            AmqpWriter ok;
            ok.shortstr(queue).long_uint(0).long_uint(0);
            send_method(*conn, frame.channel, amqp_method::QUEUE_DECLARE_OK, ok);
        } else if (id == amqp_method::BASIC_QOS) {
            args.long_uint();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                prefetch_ = args.short_uint();
            }
            send_method(*conn, frame.channel, amqp_method::BASIC_QOS_OK, AmqpWriter());
        } else if (id == amqp_method::CONFIRM_SELECT) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                conn->channels[frame.channel].confirms = true;
            }
            send_method(*conn, frame.channel, amqp_method::CONFIRM_SELECT_OK, AmqpWriter());
        } else if (id == amqp_method::BASIC_CONSUME) {
            args.short_uint();
            std::string queue = args.shortstr();
            std::lock_guard<std::mutex> lock(mutex_);
            std::string tag = "ctag-" + std::to_string(++consumer_seq_);
            AmqpWriter ok;
            ok.shortstr(tag);
            send_method(*conn, frame.channel, amqp_method::BASIC_CONSUME_OK, ok);

            consumers_[queue].push_back({conn, frame.channel, tag});
            cv_.notify_all();
            std::deque<std::string> waiting;
            waiting.swap(backlog_[queue]);
            for (const auto& body : waiting) {
                deliver(consumers_[queue].back(), queue, body);
            }
        } else if (id == amqp_method::BASIC_PUBLISH) {
            args.short_uint();
            args.shortstr();  // exchange
            std::lock_guard<std::mutex> lock(mutex_);
            ChannelState& state = conn->channels[frame.channel];
            state.assembling = true;
            state.routing_key = args.shortstr();
            state.expected = 0;
            state.body.clear();
        } else if (id == amqp_method::BASIC_ACK) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++acked_;
            cv_.notify_all();
        } else if (id == amqp_method::BASIC_REJECT) {
            uint64_t tag = args.longlong_uint();
            args.octet();
            std::lock_guard<std::mutex> lock(mutex_);
            rejected_.emplace_back(tag, args.bit(0));
            cv_.notify_all();
        }
        return true;
    }

    // Caller holds mutex_
    void finish_publish(Connection& conn, uint16_t channel, ChannelState& state) {
        std::string queue = state.routing_key;
        std::string body = std::move(state.body);
        state.body.clear();

        if (state.confirms) {
            AmqpWriter confirm;
            confirm.longlong_uint(++state.publish_seq).bits({false});
            send_method(conn, channel,
                        options_.nack_publishes ? amqp_method::BASIC_NACK : amqp_method::BASIC_ACK,
                        confirm);
        }
        if (!options_.nack_publishes) {
            route(queue, body);
        }
    }

    void drop_channel(const std::shared_ptr<Connection>& conn, uint16_t channel) {
        std::lock_guard<std::mutex> lock(mutex_);
        conn->channels.erase(channel);
        for (auto& [queue, list] : consumers_) {
            list.erase(std::remove_if(list.begin(), list.end(), [&](const Consumer& c) {
                           return c.connection == conn && c.channel == channel;
                       }),
                       list.end());
        }
    }

    Options options_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stopped_{false};
    std::thread accept_thread_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::shared_ptr<Connection>> connections_;
    std::vector<std::thread> connection_threads_;
    std::map<std::string, std::vector<Consumer>> consumers_;
    std::map<std::string, std::deque<std::string>> backlog_;
    std::map<std::string, std::vector<std::string>> history_;
    std::map<std::string, size_t> round_robin_;
    std::set<std::string> declared_;
    std::string credentials_;
    uint16_t prefetch_ = 0;
    size_t acked_ = 0;
    std::vector<std::pair<uint64_t, bool>> rejected_;
    uint64_t consumer_seq_ = 0;
};

} // namespace testing_support
} // namespace flagrun
