/**
 * @file frame.hpp
 * @brief The RFC 6455 framing, masking and message reassembly
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/buffer.hpp>
#include <string_view>
#include <optional>
#include <string>
#include <vector>
#include <array>

SPEECHWS_NS_BEGIN

namespace ws {

enum class Opcode : uint8_t {
    Continuation = 0,
    Text         = 1,
    Binary       = 2,
    Close        = 8,
    Ping         = 9,
    Pong         = 10,
};

enum CloseCode : uint16_t {
    NormalClosure           = 1000,
    GoingAway               = 1001,
    ProtocolError           = 1002,
    UnsupportedData         = 1003,
    NoStatus                = 1005,
    AbnormalClosure         = 1006,
    InvalidFramePayloadData = 1007,
    PolicyViolation         = 1008,
    MessageTooBig           = 1009,
    MandatoryExtension      = 1010,
    InternalError           = 1011,
};

using MaskKey = std::array<std::byte, 4>;

// The GUID appended to the key for Sec-WebSocket-Accept
inline constexpr auto MagicKey = std::string_view {"258EAFA5-E914-47DA-95CA-C5AB0DC85B11"};

/**
 * @brief One decoded frame, the payload is already unmasked
 *
 */
struct Frame {
    bool       fin = true;
    uint8_t    opcode = 0; //< The raw opcode, it may be a reserved one
    bool       masked = false;
    ByteVector payload;
};

inline auto isControl(uint8_t opcode) noexcept -> bool {
    return (opcode & 0x08) != 0;
}

inline auto isKnown(uint8_t opcode) noexcept -> bool {
    switch (opcode) {
        case uint8_t(Opcode::Continuation):
        case uint8_t(Opcode::Text):
        case uint8_t(Opcode::Binary):
        case uint8_t(Opcode::Close):
        case uint8_t(Opcode::Ping):
        case uint8_t(Opcode::Pong): return true;
        default: return false;
    }
}

/**
 * @brief XOR the data with the key, applying it twice gives the data back
 *
 * @param data
 * @param key
 */
extern auto SPEECHWS_API applyMask(MutableBuffer data, const MaskKey &key) noexcept -> void;

/**
 * @brief Generate a fresh random mask key
 *
 * @return MaskKey
 */
extern auto SPEECHWS_API makeMaskKey() -> MaskKey;

/**
 * @brief Encode a final, masked frame
 *
 * @param opcode
 * @param payload
 * @param key The mask key
 * @return ByteVector The whole frame
 */
extern auto SPEECHWS_API encodeFrame(Opcode opcode, Buffer payload, const MaskKey &key) -> ByteVector;

/**
 * @brief Encode a final frame masked by a fresh random key
 *
 * @param opcode
 * @param payload
 * @return ByteVector
 */
extern auto SPEECHWS_API encodeFrame(Opcode opcode, Buffer payload) -> ByteVector;

/**
 * @brief Try to decode one frame from the front of the data
 *
 * @param data The accumulated bytes
 * @param consumed Set to the size of the whole frame on success
 * @return std::optional<Frame> (nullopt if more bytes are needed)
 */
extern auto SPEECHWS_API parseFrame(Buffer data, size_t &consumed) -> std::optional<Frame>;

/**
 * @brief Build the payload of a close frame, status code in network order then the reason
 *
 * @param code
 * @param reason (truncated to 123 bytes)
 * @return ByteVector
 */
extern auto SPEECHWS_API makeClosePayload(uint16_t code, std::string_view reason = {}) -> ByteVector;

/**
 * @brief Split the payload of a close frame
 *
 * @param payload
 * @return std::pair<std::optional<uint16_t>, std::string> (no code if the payload is shorter than 2 bytes)
 */
extern auto SPEECHWS_API parseClosePayload(Buffer payload) -> std::pair<std::optional<uint16_t>, std::string>;

/**
 * @brief Reassemble the data frames into messages, control frames must not be fed
 *
 */
class SPEECHWS_API MessageAssembler {
public:
    struct Message {
        bool       binary = false;
        ByteVector data;
    };

    /**
     * @brief Feed a text, binary or continuation frame
     *
     * @param frame
     * @return std::optional<Message> The message completed by this frame
     */
    auto feed(Frame &&frame) -> std::optional<Message>;

    /**
     * @brief Check a fragmented message is in progress
     *
     * @return true
     * @return false
     */
    auto pending() const noexcept -> bool { return mOpcode.has_value(); }

    /**
     * @brief Drop the message in progress
     *
     */
    auto reset() -> void;
private:
    std::optional<Opcode>   mOpcode; //< The opcode of the leading frame
    std::vector<ByteVector> mFragments;
};

} // namespace ws

SPEECHWS_NS_END
