#pragma once

#include "flagrun/amqp_frame.h"
#include "flagrun/broker.h"
#include "flagrun/config.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

namespace flagrun {

class AmqpChannel;

// AMQP 0-9-1 connection to RabbitMQ over a plain TCP socket.
//
// open() performs the handshake (PLAIN auth, tune, vhost open) on the
// calling thread, then an I/O thread takes over the socket: it answers
// heartbeats, routes method replies to the waiting channel and assembles
// basic.deliver content into Delivery objects. Frame writes from any thread
// are serialized by write_mutex_.
class AmqpConnection {
public:
    explicit AmqpConnection(const BrokerConfig& config);
    ~AmqpConnection();

    AmqpConnection(const AmqpConnection&) = delete;
    AmqpConnection& operator=(const AmqpConnection&) = delete;

    // Throws AmqpError (handshake/auth) or std::runtime_error (socket)
    void open();

    // Sends connection.close and stops the I/O thread. Safe to call twice.
    void close();

    bool is_open() const { return open_; }

    // Reason the connection went down, empty while open
    std::string error() const;

    // Throws AmqpError
    std::unique_ptr<AmqpChannel> open_channel();

    uint16_t heartbeat_seconds() const { return heartbeat_; }
    size_t frame_max() const { return frame_max_; }

private:
    friend class AmqpChannel;

    struct ChannelState {
        std::deque<AmqpMethod> replies;
        std::deque<Delivery> deliveries;
        bool closed = false;
        std::string close_reason;

        // Content being assembled after basic.deliver
        bool assembling = false;
        bool awaiting_header = false;
        uint64_t expected_size = 0;
        Delivery pending;

        // Publisher confirms
        bool confirms = false;
        uint64_t next_publish_seq = 1;
        std::set<uint64_t> unconfirmed;
        std::set<uint64_t> nacked;
    };

    void send_frames(const std::vector<AmqpFrame>& frames);
    void send_method(uint16_t channel, AmqpMethodId id, const AmqpWriter& args);

    // Send a method and wait for `expected` on the same channel
    AmqpMethod rpc(uint16_t channel, AmqpMethodId id, const AmqpWriter& args,
                   AmqpMethodId expected);

    // Handshake helpers (before the I/O thread runs)
    AmqpFrame read_frame_blocking(std::chrono::steady_clock::time_point deadline);
    AmqpMethod expect_method(AmqpMethodId expected, std::chrono::steady_clock::time_point deadline);

    void io_loop();
    void handle_frame(const AmqpFrame& frame);
    void handle_method(uint16_t channel, const AmqpMethod& method);
    void handle_confirm(ChannelState& state, const AmqpMethod& method, bool positive);
    void fail(const std::string& reason);

    uint64_t publish(uint16_t channel, const std::string& queue, const std::string& body);
    void wait_confirm(uint16_t channel, uint64_t seq);
    void release_channel(uint16_t channel);

    BrokerConfig config_;
    int fd_ = -1;
    std::atomic<bool> open_{false};
    std::atomic<bool> stopping_{false};
    uint16_t heartbeat_ = 0;
    size_t frame_max_ = AMQP_DEFAULT_FRAME_MAX;
    uint16_t channel_max_ = 0;

    std::string read_buffer_;
    std::thread io_thread_;
    std::mutex write_mutex_;
    std::atomic<int64_t> last_write_ms_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint16_t, ChannelState> channels_;
    uint16_t next_channel_ = 1;
    std::string error_;
    bool close_ok_received_ = false;
};

// One channel on an AmqpConnection. The owning connection must outlive it.
class AmqpChannel : public MessagePublisher, public DeliveryAcknowledger {
public:
    AmqpChannel(AmqpConnection& connection, uint16_t id);
    ~AmqpChannel() override;

    AmqpChannel(const AmqpChannel&) = delete;
    AmqpChannel& operator=(const AmqpChannel&) = delete;

    uint16_t id() const { return id_; }

    void declare_queue(const std::string& name, bool durable = true);
    void set_prefetch(uint16_t count);

    // Every publish then waits for the broker's confirmation
    void enable_confirms();

    // Starts a manual-ack consumer, returns the consumer tag
    std::string consume(const std::string& queue);

    // nullopt on timeout; throws AmqpError once the channel is closed
    std::optional<Delivery> next_delivery(std::chrono::milliseconds timeout);

    bool is_open() const override;
    void publish(const std::string& queue, const std::string& body) override;
    void ack(uint64_t delivery_tag) override;
    void reject(uint64_t delivery_tag, bool requeue) override;

    void close();

private:
    AmqpConnection& connection_;
    uint16_t id_;
    std::atomic<bool> closed_{false};
};

} // namespace flagrun
