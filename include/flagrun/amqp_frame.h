#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace flagrun {

// AMQP 0-9-1 wire codec. Only the subset of the protocol needed for
// durable queues on the default exchange with manual acknowledgement.

class AmqpError : public std::runtime_error {
public:
    explicit AmqpError(const std::string& message, uint16_t reply_code = 0)
        : std::runtime_error(message), reply_code_(reply_code) {}

    uint16_t reply_code() const { return reply_code_; }

private:
    uint16_t reply_code_;
};

enum class AmqpFrameType : uint8_t {
    METHOD = 1,
    HEADER = 2,
    BODY = 3,
    HEARTBEAT = 8
};

constexpr uint8_t AMQP_FRAME_END = 0xCE;
constexpr size_t AMQP_FRAME_OVERHEAD = 8;  // type + channel + size + frame-end
extern const std::string AMQP_PROTOCOL_HEADER;

struct AmqpMethodId {
    uint16_t class_id;
    uint16_t method_id;

    bool operator==(const AmqpMethodId& other) const {
        return class_id == other.class_id && method_id == other.method_id;
    }
    bool operator!=(const AmqpMethodId& other) const { return !(*this == other); }
};

namespace amqp_method {
constexpr AmqpMethodId CONNECTION_START{10, 10};
constexpr AmqpMethodId CONNECTION_START_OK{10, 11};
constexpr AmqpMethodId CONNECTION_TUNE{10, 30};
constexpr AmqpMethodId CONNECTION_TUNE_OK{10, 31};
constexpr AmqpMethodId CONNECTION_OPEN{10, 40};
constexpr AmqpMethodId CONNECTION_OPEN_OK{10, 41};
constexpr AmqpMethodId CONNECTION_CLOSE{10, 50};
constexpr AmqpMethodId CONNECTION_CLOSE_OK{10, 51};
constexpr AmqpMethodId CHANNEL_OPEN{20, 10};
constexpr AmqpMethodId CHANNEL_OPEN_OK{20, 11};
constexpr AmqpMethodId CHANNEL_CLOSE{20, 40};
constexpr AmqpMethodId CHANNEL_CLOSE_OK{20, 41};
constexpr AmqpMethodId QUEUE_DECLARE{50, 10};
constexpr AmqpMethodId QUEUE_DECLARE_OK{50, 11};
constexpr AmqpMethodId BASIC_QOS{60, 10};
constexpr AmqpMethodId BASIC_QOS_OK{60, 11};
constexpr AmqpMethodId BASIC_CONSUME{60, 20};
constexpr AmqpMethodId BASIC_CONSUME_OK{60, 21};
constexpr AmqpMethodId BASIC_CANCEL{60, 30};
constexpr AmqpMethodId BASIC_PUBLISH{60, 40};
constexpr AmqpMethodId BASIC_DELIVER{60, 60};
constexpr AmqpMethodId BASIC_ACK{60, 80};
constexpr AmqpMethodId BASIC_REJECT{60, 90};
constexpr AmqpMethodId BASIC_NACK{60, 120};
constexpr AmqpMethodId CONFIRM_SELECT{85, 10};
constexpr AmqpMethodId CONFIRM_SELECT_OK{85, 11};
}

constexpr uint16_t AMQP_BASIC_CLASS = 60;
constexpr uint16_t AMQP_REPLY_SUCCESS = 200;

// Basic content properties flags
constexpr uint16_t AMQP_PROP_CONTENT_TYPE = 0x8000;
constexpr uint16_t AMQP_PROP_DELIVERY_MODE = 0x1000;
constexpr uint8_t AMQP_DELIVERY_PERSISTENT = 2;

struct AmqpFrame {
    AmqpFrameType type = AmqpFrameType::HEARTBEAT;
    uint16_t channel = 0;
    std::string payload;
};

// Big-endian field encoder
class AmqpWriter {
public:
    AmqpWriter& octet(uint8_t value);
    AmqpWriter& short_uint(uint16_t value);
    AmqpWriter& long_uint(uint32_t value);
    AmqpWriter& longlong_uint(uint64_t value);
    AmqpWriter& shortstr(const std::string& value);  // throws AmqpError if > 255 bytes
    AmqpWriter& longstr(const std::string& value);
    AmqpWriter& table(const std::map<std::string, std::string>& entries);  // string values only
    AmqpWriter& bits(const std::vector<bool>& flags);  // packed into one octet
    AmqpWriter& raw(const std::string& bytes);

    const std::string& data() const { return data_; }

private:
    std::string data_;
};

// Big-endian field decoder; throws AmqpError on underflow
class AmqpReader {
public:
    explicit AmqpReader(const std::string& data, size_t offset = 0)
        : data_(data), pos_(offset) {}

    uint8_t octet();
    uint16_t short_uint();
    uint32_t long_uint();
    uint64_t longlong_uint();
    std::string shortstr();
    std::string longstr();
    void skip_table();
    bool bit(int index);  // reads from the most recent octet() value

    size_t position() const { return pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

private:
    void require(size_t n) const;

    const std::string& data_;
    size_t pos_;
    uint8_t last_octet_ = 0;
};

struct AmqpMethod {
    AmqpMethodId id{0, 0};
    std::string args;  // encoded arguments after the ids
};

std::string encode_frame(const AmqpFrame& frame);

// Decodes one frame from the front of `buffer`. Returns the number of bytes
// consumed, or 0 when the buffer does not yet hold a whole frame.
size_t decode_frame(const std::string& buffer, AmqpFrame& out);

std::string encode_method(AmqpMethodId id, const AmqpWriter& args);
AmqpMethod decode_method(const std::string& payload);

std::string encode_content_header(uint64_t body_size, const std::string& content_type,
                                  uint8_t delivery_mode);
uint64_t decode_content_body_size(const std::string& payload);

// Frames for basic.publish to the default exchange: method, header, body chunks
std::vector<AmqpFrame> encode_publish(uint16_t channel, const std::string& routing_key,
                                      const std::string& body, const std::string& content_type,
                                      size_t frame_max);

// Reply text of a connection.close / channel.close method
std::string describe_close(const AmqpMethod& method, uint16_t* reply_code = nullptr);

} // namespace flagrun
