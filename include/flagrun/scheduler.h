#pragma once

#include "flagrun/amqp_client.h"
#include "flagrun/broker.h"
#include "flagrun/completion_registry.h"
#include "flagrun/config.h"
#include "flagrun/crypto.h"
#include "flagrun/http_server.h"
#include "flagrun/messages.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace flagrun {

using PendingResults = CompletionRegistry<ResultMessage>;

// POST /submit: decrypt settings, publish a task, wait for its result and
// answer with the flag of its stdout.
class SubmitHandler {
public:
    SubmitHandler(const SchedulerConfig& config, MessagePublisher& publisher,
                  PendingResults& pending);

    HttpResponse handle(const HttpRequest& req) const;

    // Both keys present and the encryption key is a valid Fernet key
    bool keys_configured() const { return cipher_ != nullptr && !signature_key_.empty(); }

private:
    std::unique_ptr<FernetCipher> cipher_;
    std::string signature_key_;
    int settings_ttl_seconds_;
    std::chrono::seconds execution_timeout_;
    std::string task_queue_;
    MessagePublisher& publisher_;
    PendingResults& pending_;
};

// Routes results from the results queue to their waiting submissions
class ResultConsumer {
public:
    explicit ResultConsumer(PendingResults& pending) : pending_(pending) {}

    // Resolves the matching submission, or logs and drops. Always acks.
    void handle(const Delivery& delivery, DeliveryAcknowledger& acker) const;

    // Consume with reconnect until `stop` is set
    void run(const BrokerConfig& config, const std::atomic<bool>& stop) const;

private:
    PendingResults& pending_;
};

// Publisher that keeps a broker connection alive in the background.
// While disconnected is_open() is false and publish() throws AmqpError.
class BrokerPublisher : public MessagePublisher {
public:
    explicit BrokerPublisher(const BrokerConfig& config);
    ~BrokerPublisher() override;

    void start();
    void stop();

    bool is_open() const override;
    void publish(const std::string& queue, const std::string& body) override;

private:
    struct Session {
        std::unique_ptr<AmqpConnection> connection;
        std::unique_ptr<AmqpChannel> channel;  // destroyed before the connection
    };

    std::shared_ptr<Session> connect() const;
    std::shared_ptr<Session> current() const;
    void supervise();

    BrokerConfig config_;
    std::atomic<bool> stopping_{false};
    std::thread supervisor_;
    mutable std::mutex mutex_;
    std::shared_ptr<Session> session_;
};

// Scheduler service: HTTP ingress, task publisher and result consumer
class Scheduler {
public:
    explicit Scheduler(const SchedulerConfig& config);
    ~Scheduler();

    // Blocks until stop()
    void run();

    // Stops accepting, answers waiting submissions with 503 and shuts the
    // broker loops down. Safe before, during or after run().
    void stop();

    // Bound HTTP port once listening
    int port() const { return server_.port(); }
    bool wait_until_listening(int timeout_ms) const { return server_.wait_until_listening(timeout_ms); }

private:
    SchedulerConfig config_;
    PendingResults pending_;
    BrokerPublisher publisher_;
    SubmitHandler handler_;
    ResultConsumer consumer_;
    HttpServer server_;
    std::atomic<bool> stopping_{false};
    std::mutex lifecycle_mutex_;  // guards consumer_thread_ and the publisher's start/stop
    std::thread consumer_thread_;
};

} // namespace flagrun
