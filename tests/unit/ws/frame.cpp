#include <speechws/ws/frame.hpp>
#include <gtest/gtest.h>
#include <string>

using namespace SPEECHWS_NAMESPACE;
using namespace SPEECHWS_NAMESPACE::ws;
using namespace std::literals;

// Build an unmasked frame, the way a server sends it
auto serverFrame(uint8_t opcode, std::string_view payload, bool fin = true) -> ByteVector {
    ByteVector frame;
    frame.push_back(std::byte((fin ? 0x80 : 0x00) | opcode));
    frame.push_back(std::byte(payload.size())); // Only small payloads here
    auto buf = makeBuffer(payload);
    frame.insert(frame.end(), buf.begin(), buf.end());
    return frame;
}

auto makePayload(size_t size) -> ByteVector {
    ByteVector payload(size);
    for (size_t i = 0; i < size; ++i) {
        payload[i] = std::byte(i * 31 + 7);
    }
    return payload;
}

TEST(Frame, LengthTiers) {
    const MaskKey key {std::byte(0x12), std::byte(0x34), std::byte(0x56), std::byte(0x78)};
    const std::pair<size_t, size_t> tiers[] = {
        {0, 2}, {1, 2}, {125, 2}, {126, 4}, {65535, 4}, {65536, 10}
    };
    for (auto [size, header] : tiers) {
        auto payload = makePayload(size);
        auto frame = encodeFrame(Opcode::Binary, payload, key);
        ASSERT_EQ(frame.size(), header + 4 + size) << "size " << size;
        ASSERT_EQ(frame[0], std::byte(0x82)); // FIN | Binary
        ASSERT_EQ(std::to_integer<uint8_t>(frame[1]) & 0x80, 0x80); // Always masked

        size_t consumed = 0;
        auto decoded = parseFrame(frame, consumed);
        ASSERT_TRUE(decoded) << "size " << size;
        ASSERT_EQ(consumed, frame.size());
        ASSERT_TRUE(decoded->fin);
        ASSERT_TRUE(decoded->masked);
        ASSERT_EQ(decoded->opcode, uint8_t(Opcode::Binary));
        ASSERT_EQ(decoded->payload, payload) << "size " << size;
    }
}

TEST(Frame, LengthEncoding) {
    const MaskKey key {};
    auto frame = encodeFrame(Opcode::Text, makePayload(126), key);
    ASSERT_EQ(frame[1], std::byte(0x80 | 126));
    ASSERT_EQ(frame[2], std::byte(0x00));
    ASSERT_EQ(frame[3], std::byte(126));

    frame = encodeFrame(Opcode::Text, makePayload(65536), key);
    ASSERT_EQ(frame[1], std::byte(0x80 | 127));
    for (size_t i = 2; i < 7; ++i) {
        ASSERT_EQ(frame[i], std::byte(0x00));
    }
    ASSERT_EQ(frame[7], std::byte(0x01)); // 0x10000
    ASSERT_EQ(frame[8], std::byte(0x00));
    ASSERT_EQ(frame[9], std::byte(0x00));
}

TEST(Frame, MaskIsInvolution) {
    auto payload = makePayload(1000);
    const MaskKey keys[] = {
        {std::byte(0x00), std::byte(0x00), std::byte(0x00), std::byte(0x00)},
        {std::byte(0xff), std::byte(0x01), std::byte(0x80), std::byte(0x7f)},
        makeMaskKey(),
    };
    for (auto &key : keys) {
        auto data = payload;
        applyMask(data, key);
        applyMask(data, key);
        ASSERT_EQ(data, payload);
    }

    // The wire bytes are the payload xor the key
    const MaskKey key {std::byte(0x01), std::byte(0x02), std::byte(0x03), std::byte(0x04)};
    auto frame = encodeFrame(Opcode::Text, makeBuffer("abcde"sv), key);
    ASSERT_EQ(frame.size(), 2 + 4 + 5);
    ASSERT_EQ(frame[6], std::byte('a' ^ 0x01));
    ASSERT_EQ(frame[9], std::byte('d' ^ 0x04));
    ASSERT_EQ(frame[10], std::byte('e' ^ 0x01));
}

TEST(Frame, RandomMask) {
    auto a = encodeFrame(Opcode::Text, makeBuffer("hello"sv));
    size_t consumed = 0;
    auto frame = parseFrame(a, consumed);
    ASSERT_TRUE(frame);
    ASSERT_EQ(asStringView(frame->payload), "hello");
}

TEST(Frame, NeedMoreBytes) {
    auto frame = encodeFrame(Opcode::Text, makePayload(300), MaskKey {});
    for (size_t len = 0; len < frame.size(); ++len) {
        size_t consumed = 0;
        ASSERT_FALSE(parseFrame(Buffer(frame).subspan(0, len), consumed)) << "len " << len;
    }

    // Two frames back to back, only the first one is taken
    auto data = serverFrame(0x1, "one");
    auto second = serverFrame(0x1, "two");
    data.insert(data.end(), second.begin(), second.end());
    size_t consumed = 0;
    auto first = parseFrame(data, consumed);
    ASSERT_TRUE(first);
    ASSERT_FALSE(first->masked);
    ASSERT_EQ(asStringView(first->payload), "one");
    ASSERT_EQ(consumed, 5);
}

TEST(Frame, ReservedOpcode) {
    auto data = serverFrame(0x3, "x");
    size_t consumed = 0;
    auto frame = parseFrame(data, consumed);
    ASSERT_TRUE(frame);
    ASSERT_EQ(frame->opcode, 0x3);
    ASSERT_FALSE(isKnown(frame->opcode));
    ASSERT_FALSE(isKnown(0xB));
    ASSERT_TRUE(isKnown(uint8_t(Opcode::Pong)));
    ASSERT_TRUE(isControl(uint8_t(Opcode::Ping)));
    ASSERT_FALSE(isControl(uint8_t(Opcode::Continuation)));
}

TEST(Frame, ClosePayload) {
    auto payload = makeClosePayload(NormalClosure, "bye");
    ASSERT_EQ(payload.size(), 5);
    ASSERT_EQ(payload[0], std::byte(0x03));
    ASSERT_EQ(payload[1], std::byte(0xE8));

    auto [code, reason] = parseClosePayload(payload);
    ASSERT_EQ(code, 1000);
    ASSERT_EQ(reason, "bye");

    auto [none, empty] = parseClosePayload(ByteVector {std::byte(0x03)});
    ASSERT_FALSE(none);
    ASSERT_TRUE(empty.empty());

    auto longReason = std::string(200, 'x');
    ASSERT_EQ(makeClosePayload(GoingAway, longReason).size(), 2 + 123);
}

class Reassembly : public ::testing::TestWithParam<size_t> { };

TEST_P(Reassembly, Fragments) {
    auto count = GetParam();
    auto text = "The quick brown fox jumps over the lazy dog"s;

    MessageAssembler assembler;
    std::optional<MessageAssembler::Message> message;
    auto step = text.size() / count;
    for (size_t i = 0; i < count; ++i) {
        auto last = i + 1 == count;
        auto part = std::string_view(text).substr(i * step, last ? std::string_view::npos : step);
        Frame frame;
        frame.fin = last;
        frame.opcode = uint8_t(i == 0 ? Opcode::Text : Opcode::Continuation);
        frame.payload = toBytes(makeBuffer(part));
        message = assembler.feed(std::move(frame));
        ASSERT_EQ(message.has_value(), last);
        ASSERT_EQ(assembler.pending(), !last);
    }
    ASSERT_FALSE(message->binary);
    ASSERT_EQ(asStringView(message->data), text);
}

INSTANTIATE_TEST_SUITE_P(Frame, Reassembly, ::testing::Values(1, 2, 5));

TEST(Frame, ReassemblyViolations) {
    MessageAssembler assembler;

    // Continuation without a leading frame
    ASSERT_FALSE(assembler.feed(Frame {.fin = true, .opcode = 0, .payload = toBytes(makeBuffer("x"sv))}));
    ASSERT_FALSE(assembler.pending());

    // A new message drops the partial one
    ASSERT_FALSE(assembler.feed(Frame {.fin = false, .opcode = 2, .payload = toBytes(makeBuffer("partial"sv))}));
    ASSERT_TRUE(assembler.pending());
    auto message = assembler.feed(Frame {.fin = true, .opcode = 1, .payload = toBytes(makeBuffer("whole"sv))});
    ASSERT_TRUE(message);
    ASSERT_FALSE(message->binary);
    ASSERT_EQ(asStringView(message->data), "whole");
    ASSERT_FALSE(assembler.pending());

    // Binary fragments keep the leading opcode
    ASSERT_FALSE(assembler.feed(Frame {.fin = false, .opcode = 2, .payload = toBytes(makeBuffer("ab"sv))}));
    message = assembler.feed(Frame {.fin = true, .opcode = 0, .payload = toBytes(makeBuffer("cd"sv))});
    ASSERT_TRUE(message);
    ASSERT_TRUE(message->binary);
    ASSERT_EQ(asStringView(message->data), "abcd");
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
