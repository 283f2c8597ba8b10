/**
 * Unit tests for the AMQP 0-9-1 frame codec
 *
 * Byte layouts are checked against the protocol grammar so the client
 * interoperates with a real broker without needing one in the test run.
 */

#include <gtest/gtest.h>
#include "flagrun/amqp_frame.h"

using namespace flagrun;

namespace {

std::string bytes(std::initializer_list<int> values) {
    std::string out;
    for (int v : values) out.push_back(static_cast<char>(v));
    return out;
}

} // namespace

// ============================================================================
// Test Contract: Field Encoding
// ============================================================================

TEST(AmqpWriterTest, EncodesIntegersBigEndian) {
    AmqpWriter writer;
    writer.octet(0x01).short_uint(0x0203).long_uint(0x04050607).longlong_uint(0x08090a0b0c0d0e0fULL);

    EXPECT_EQ(writer.data(), bytes({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15}));
}

TEST(AmqpWriterTest, EncodesStrings) {
    AmqpWriter writer;
    writer.shortstr("abc").longstr("de");

    EXPECT_EQ(writer.data(), bytes({3, 'a', 'b', 'c', 0, 0, 0, 2, 'd', 'e'}));
}

TEST(AmqpWriterTest, RejectsOversizedShortString) {
    AmqpWriter writer;
    EXPECT_THROW(writer.shortstr(std::string(256, 'x')), AmqpError);
}

TEST(AmqpWriterTest, PacksBitsLeastSignificantFirst) {
    AmqpWriter writer;
    writer.bits({false, true, false, false, true});  // durable + no-wait positions

    EXPECT_EQ(writer.data(), bytes({0x12}));
}

TEST(AmqpWriterTest, EncodesStringTable) {
    AmqpWriter writer;
    writer.table({{"k", "v"}});

    // long size, shortstr name, 'S', longstr value
    EXPECT_EQ(writer.data(), bytes({0, 0, 0, 8, 1, 'k', 'S', 0, 0, 0, 1, 'v'}));
}

TEST(AmqpWriterTest, EncodesEmptyTable) {
    AmqpWriter writer;
    writer.table({});
    EXPECT_EQ(writer.data(), bytes({0, 0, 0, 0}));
}

// ============================================================================
// Test Contract: Field Decoding
// ============================================================================

TEST(AmqpReaderTest, ReadsWhatWriterWrote) {
    AmqpWriter writer;
    writer.octet(7).short_uint(513).long_uint(70000).longlong_uint(1ULL << 40)
          .shortstr("queue").longstr("body").table({{"a", "b"}}).bits({true, false});

    AmqpReader reader(writer.data());
    EXPECT_EQ(reader.octet(), 7);
    EXPECT_EQ(reader.short_uint(), 513);
    EXPECT_EQ(reader.long_uint(), 70000u);
    EXPECT_EQ(reader.longlong_uint(), 1ULL << 40);
    EXPECT_EQ(reader.shortstr(), "queue");
    EXPECT_EQ(reader.longstr(), "body");
    reader.skip_table();
    reader.octet();
    EXPECT_TRUE(reader.bit(0));
    EXPECT_FALSE(reader.bit(1));
    EXPECT_TRUE(reader.at_end());
}

TEST(AmqpReaderTest, ThrowsOnTruncatedInput) {
    std::string data = bytes({0, 0, 0, 10, 'x'});
    AmqpReader reader(data);
    EXPECT_THROW(reader.longstr(), AmqpError);

    std::string short_data = bytes({1});
    AmqpReader short_reader(short_data);
    EXPECT_THROW(short_reader.short_uint(), AmqpError);
}

// ============================================================================
// Test Contract: Frames
// ============================================================================

TEST(AmqpFrameTest, EncodesHeartbeat) {
    std::string wire = encode_frame({AmqpFrameType::HEARTBEAT, 0, ""});
    EXPECT_EQ(wire, bytes({8, 0, 0, 0, 0, 0, 0, 0xCE}));
}

TEST(AmqpFrameTest, DecodesCompleteFrame) {
    std::string wire = encode_frame({AmqpFrameType::BODY, 3, "payload"});

    AmqpFrame frame;
    size_t consumed = decode_frame(wire, frame);

    EXPECT_EQ(consumed, wire.size());
    EXPECT_EQ(frame.type, AmqpFrameType::BODY);
    EXPECT_EQ(frame.channel, 3);
    EXPECT_EQ(frame.payload, "payload");
}

TEST(AmqpFrameTest, WaitsForPartialFrame) {
    std::string wire = encode_frame({AmqpFrameType::BODY, 1, "0123456789"});

    AmqpFrame frame;
    EXPECT_EQ(decode_frame(wire.substr(0, 5), frame), 0u);
    EXPECT_EQ(decode_frame(wire.substr(0, wire.size() - 1), frame), 0u);
}

TEST(AmqpFrameTest, DecodesBackToBackFrames) {
    std::string wire = encode_frame({AmqpFrameType::METHOD, 1, "a"}) +
                       encode_frame({AmqpFrameType::HEARTBEAT, 0, ""});

    AmqpFrame first;
    size_t consumed = decode_frame(wire, first);
    ASSERT_GT(consumed, 0u);
    EXPECT_EQ(first.payload, "a");

    AmqpFrame second;
    EXPECT_GT(decode_frame(wire.substr(consumed), second), 0u);
    EXPECT_EQ(second.type, AmqpFrameType::HEARTBEAT);
}

TEST(AmqpFrameTest, RejectsBadFrameEnd) {
    std::string wire = encode_frame({AmqpFrameType::BODY, 1, "x"});
    wire.back() = 0x00;

    AmqpFrame frame;
    EXPECT_THROW(decode_frame(wire, frame), AmqpError);
}

TEST(AmqpFrameTest, RejectsUnknownFrameType) {
    std::string wire = bytes({9, 0, 0, 0, 0, 0, 0, 0xCE});
    AmqpFrame frame;
    EXPECT_THROW(decode_frame(wire, frame), AmqpError);
}

// ============================================================================
// Test Contract: Methods and Content
// ============================================================================

TEST(AmqpMethodTest, EncodesClassAndMethodIds) {
    AmqpWriter args;
    args.longlong_uint(5).bits({false});

    std::string payload = encode_method(amqp_method::BASIC_ACK, args);

    EXPECT_EQ(payload.substr(0, 4), bytes({0, 60, 0, 80}));
    AmqpMethod method = decode_method(payload);
    EXPECT_EQ(method.id, amqp_method::BASIC_ACK);
    EXPECT_EQ(method.args, args.data());
}

TEST(AmqpMethodTest, DescribesCloseReason) {
    AmqpWriter args;
    args.short_uint(404).shortstr("NOT_FOUND - no queue 'x'").short_uint(50).short_uint(10);
    AmqpMethod method = decode_method(encode_method(amqp_method::CHANNEL_CLOSE, args));

    uint16_t code = 0;
    EXPECT_EQ(describe_close(method, &code), "404 NOT_FOUND - no queue 'x'");
    EXPECT_EQ(code, 404);
}

TEST(AmqpContentTest, HeaderCarriesPersistentJsonProperties) {
    std::string header = encode_content_header(42, "application/json", AMQP_DELIVERY_PERSISTENT);

    AmqpReader reader(header);
    EXPECT_EQ(reader.short_uint(), AMQP_BASIC_CLASS);
    EXPECT_EQ(reader.short_uint(), 0);  // weight
    EXPECT_EQ(reader.longlong_uint(), 42u);
    EXPECT_EQ(reader.short_uint(), AMQP_PROP_CONTENT_TYPE | AMQP_PROP_DELIVERY_MODE);
    EXPECT_EQ(reader.shortstr(), "application/json");
    EXPECT_EQ(reader.octet(), 2);
    EXPECT_TRUE(reader.at_end());

    EXPECT_EQ(decode_content_body_size(header), 42u);
}

TEST(AmqpContentTest, PublishSplitsBodyByFrameMax) {
    // Given: A frame_max leaving 10 payload bytes per body frame
    std::string body(25, 'x');

    auto frames = encode_publish(1, "execution_tasks", body, "application/json",
                                 10 + AMQP_FRAME_OVERHEAD);

    // Then: method, header, and three body frames
    ASSERT_EQ(frames.size(), 5u);
    EXPECT_EQ(frames[0].type, AmqpFrameType::METHOD);
    EXPECT_EQ(decode_method(frames[0].payload).id, amqp_method::BASIC_PUBLISH);
    EXPECT_EQ(frames[1].type, AmqpFrameType::HEADER);
    EXPECT_EQ(frames[2].payload.size(), 10u);
    EXPECT_EQ(frames[4].payload.size(), 5u);
    for (const auto& frame : frames) {
        EXPECT_EQ(frame.channel, 1);
    }
}

TEST(AmqpContentTest, PublishTargetsDefaultExchange) {
    auto frames = encode_publish(2, "execution_results", "{}", "application/json",
                                 AMQP_FRAME_OVERHEAD + 4096);

    AmqpMethod method = decode_method(frames[0].payload);
    AmqpReader reader(method.args);
    EXPECT_EQ(reader.short_uint(), 0);               // reserved
    EXPECT_EQ(reader.shortstr(), "");                // default exchange
    EXPECT_EQ(reader.shortstr(), "execution_results");
}

TEST(AmqpContentTest, EmptyBodyHasNoBodyFrames) {
    auto frames = encode_publish(1, "q", "", "application/json", 4096);
    EXPECT_EQ(frames.size(), 2u);
}

TEST(AmqpProtocolTest, HeaderAnnouncesVersion091) {
    EXPECT_EQ(AMQP_PROTOCOL_HEADER, std::string("AMQP\0\0\x09\x01", 8));
}
