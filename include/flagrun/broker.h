#pragma once

#include <cstdint>
#include <string>

namespace flagrun {

// One message handed to a consumer
struct Delivery {
    uint64_t delivery_tag = 0;
    bool redelivered = false;
    std::string body;
};

// Publishes persistent JSON messages to a named queue
class MessagePublisher {
public:
    virtual ~MessagePublisher() = default;

    virtual bool is_open() const = 0;

    // Throws when the message could not be handed to the broker
    virtual void publish(const std::string& queue, const std::string& body) = 0;
};

// Settles deliveries taken from a consumer channel
class DeliveryAcknowledger {
public:
    virtual ~DeliveryAcknowledger() = default;

    virtual void ack(uint64_t delivery_tag) = 0;
    virtual void reject(uint64_t delivery_tag, bool requeue) = 0;
};

} // namespace flagrun
