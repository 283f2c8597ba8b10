#include "flagrun/amqp_frame.h"

namespace flagrun {

const std::string AMQP_PROTOCOL_HEADER("AMQP\x00\x00\x09\x01", 8);

AmqpWriter& AmqpWriter::octet(uint8_t value) {
    data_.push_back(static_cast<char>(value));
    return *this;
}

AmqpWriter& AmqpWriter::short_uint(uint16_t value) {
    octet(static_cast<uint8_t>(value >> 8));
    return octet(static_cast<uint8_t>(value & 0xFF));
}

AmqpWriter& AmqpWriter::long_uint(uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        octet(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
}

AmqpWriter& AmqpWriter::longlong_uint(uint64_t value) {
    for (int i = 7; i >= 0; --i) {
        octet(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
}

AmqpWriter& AmqpWriter::shortstr(const std::string& value) {
    if (value.size() > 255) {
        throw AmqpError("Short string exceeds 255 bytes: " + value.substr(0, 32) + "...");
    }
    octet(static_cast<uint8_t>(value.size()));
    data_ += value;
    return *this;
}

AmqpWriter& AmqpWriter::longstr(const std::string& value) {
    long_uint(static_cast<uint32_t>(value.size()));
    data_ += value;
    return *this;
}

AmqpWriter& AmqpWriter::table(const std::map<std::string, std::string>& entries) {
    AmqpWriter body;
    for (const auto& [name, value] : entries) {
        body.shortstr(name);
        body.octet('S');
        body.longstr(value);
    }
    return longstr(body.data());
}

AmqpWriter& AmqpWriter::bits(const std::vector<bool>& flags) {
    uint8_t packed = 0;
    for (size_t i = 0; i < flags.size() && i < 8; ++i) {
        if (flags[i]) packed |= static_cast<uint8_t>(1u << i);
    }
    return octet(packed);
}

AmqpWriter& AmqpWriter::raw(const std::string& bytes) {
    data_ += bytes;
    return *this;
}

void AmqpReader::require(size_t n) const {
    if (pos_ + n > data_.size()) {
        throw AmqpError("Truncated AMQP field");
    }
}

uint8_t AmqpReader::octet() {
    require(1);
    last_octet_ = static_cast<uint8_t>(data_[pos_++]);
    return last_octet_;
}

uint16_t AmqpReader::short_uint() {
    require(2);
    uint16_t hi = static_cast<uint8_t>(data_[pos_]);
    uint16_t lo = static_cast<uint8_t>(data_[pos_ + 1]);
    pos_ += 2;
    return static_cast<uint16_t>((hi << 8) | lo);
}

uint32_t AmqpReader::long_uint() {
    require(4);
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | static_cast<uint8_t>(data_[pos_++]);
    }
    return value;
}

uint64_t AmqpReader::longlong_uint() {
    require(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint8_t>(data_[pos_++]);
    }
    return value;
}

std::string AmqpReader::shortstr() {
    size_t len = octet();
    require(len);
    std::string value = data_.substr(pos_, len);
    pos_ += len;
    return value;
}

std::string AmqpReader::longstr() {
    size_t len = long_uint();
    require(len);
    std::string value = data_.substr(pos_, len);
    pos_ += len;
    return value;
}

void AmqpReader::skip_table() {
    size_t len = long_uint();
    require(len);
    pos_ += len;
}

bool AmqpReader::bit(int index) {
    return (last_octet_ >> index) & 1;
}

std::string encode_frame(const AmqpFrame& frame) {
    AmqpWriter out;
    out.octet(static_cast<uint8_t>(frame.type))
       .short_uint(frame.channel)
       .long_uint(static_cast<uint32_t>(frame.payload.size()))
       .raw(frame.payload)
       .octet(AMQP_FRAME_END);
    return out.data();
}

size_t decode_frame(const std::string& buffer, AmqpFrame& out) {
    if (buffer.size() < 7) return 0;

    AmqpReader reader(buffer);
    uint8_t type = reader.octet();
    uint16_t channel = reader.short_uint();
    uint32_t size = reader.long_uint();

    size_t total = 7 + static_cast<size_t>(size) + 1;
    if (buffer.size() < total) return 0;

    if (static_cast<uint8_t>(buffer[total - 1]) != AMQP_FRAME_END) {
        throw AmqpError("Invalid AMQP frame end marker");
    }
    if (type != 1 && type != 2 && type != 3 && type != 8) {
        throw AmqpError("Unknown AMQP frame type " + std::to_string(type));
    }

    out.type = static_cast<AmqpFrameType>(type);
    out.channel = channel;
    out.payload = buffer.substr(7, size);
    return total;
}

std::string encode_method(AmqpMethodId id, const AmqpWriter& args) {
    AmqpWriter out;
    out.short_uint(id.class_id).short_uint(id.method_id).raw(args.data());
    return out.data();
}

AmqpMethod decode_method(const std::string& payload) {
    AmqpReader reader(payload);
    AmqpMethod method;
    method.id.class_id = reader.short_uint();
    method.id.method_id = reader.short_uint();
    method.args = payload.substr(reader.position());
    return method;
}

std::string encode_content_header(uint64_t body_size, const std::string& content_type,
                                  uint8_t delivery_mode) {
    uint16_t flags = 0;
    if (!content_type.empty()) flags |= AMQP_PROP_CONTENT_TYPE;
    if (delivery_mode != 0) flags |= AMQP_PROP_DELIVERY_MODE;

    AmqpWriter out;
    out.short_uint(AMQP_BASIC_CLASS).short_uint(0).longlong_uint(body_size).short_uint(flags);
    // Property values follow in flag order
    if (!content_type.empty()) out.shortstr(content_type);
    if (delivery_mode != 0) out.octet(delivery_mode);
    return out.data();
}

uint64_t decode_content_body_size(const std::string& payload) {
    AmqpReader reader(payload);
    reader.short_uint();  // class-id
    reader.short_uint();  // weight
    return reader.longlong_uint();
}

std::vector<AmqpFrame> encode_publish(uint16_t channel, const std::string& routing_key,
                                      const std::string& body, const std::string& content_type,
                                      size_t frame_max) {
    std::vector<AmqpFrame> frames;

    AmqpWriter args;
    args.short_uint(0)          // reserved-1
        .shortstr("")           // default exchange
        .shortstr(routing_key)
        .bits({false, false});  // mandatory, immediate
    frames.push_back({AmqpFrameType::METHOD, channel, encode_method(amqp_method::BASIC_PUBLISH, args)});

    frames.push_back({AmqpFrameType::HEADER, channel,
                      encode_content_header(body.size(), content_type, AMQP_DELIVERY_PERSISTENT)});

    size_t chunk = frame_max > AMQP_FRAME_OVERHEAD ? frame_max - AMQP_FRAME_OVERHEAD : body.size();
    if (chunk == 0) chunk = 1;
    for (size_t offset = 0; offset < body.size(); offset += chunk) {
        frames.push_back({AmqpFrameType::BODY, channel, body.substr(offset, chunk)});
    }
    return frames;
}

std::string describe_close(const AmqpMethod& method, uint16_t* reply_code) {
    AmqpReader reader(method.args);
    uint16_t code = reader.short_uint();
    std::string text = reader.shortstr();
    if (reply_code) *reply_code = code;
    return std::to_string(code) + " " + text;
}

} // namespace flagrun
