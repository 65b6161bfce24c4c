/**
 * @file frame.cpp
 * @brief The RFC 6455 frame codec
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#include <speechws/ws/frame.hpp>
#include <speechws/crypt.hpp>
#include <speechws/log.hpp>
#include <algorithm>
#include <cstring>
#include <bit>

SPEECHWS_NS_BEGIN

namespace ws {

namespace {

// Read a big endian integer from the bytes
template <typename T>
auto loadBigEndian(const std::byte *ptr) noexcept -> T {
    T value {};
    ::memcpy(&value, ptr, sizeof(T));
    if constexpr (std::endian::native == std::endian::little) {
        value = std::byteswap(value);
    }
    return value;
}

template <typename T>
auto storeBigEndian(std::byte *ptr, T value) noexcept -> void {
    if constexpr (std::endian::native == std::endian::little) {
        value = std::byteswap(value);
    }
    ::memcpy(ptr, &value, sizeof(T));
}

constexpr auto MaxReasonLength = size_t(123);

} // namespace

auto applyMask(MutableBuffer data, const MaskKey &key) noexcept -> void {
    for (size_t idx = 0; idx < data.size(); ++idx) {
        data[idx] ^= key[idx % 4];
    }
}

auto makeMaskKey() -> MaskKey {
    MaskKey key {};
    auto bytes = randomBytes(key.size());
    std::copy_n(bytes.begin(), key.size(), key.begin());
    return key;
}

auto encodeFrame(Opcode opcode, Buffer payload, const MaskKey &key) -> ByteVector {
    ByteVector frame;
    frame.reserve(14 + payload.size());

    // FIN + opcode, no extensions so RSV is always 0
    frame.push_back(std::byte(0x80 | uint8_t(opcode)));

    // Client frames are always masked
    auto len = payload.size();
    if (len < 126) {
        frame.push_back(std::byte(0x80 | len));
    }
    else if (len <= 0xFFFF) {
        frame.push_back(std::byte(0x80 | 126));
        frame.resize(frame.size() + 2);
        storeBigEndian(frame.data() + 2, uint16_t(len));
    }
    else {
        frame.push_back(std::byte(0x80 | 127));
        frame.resize(frame.size() + 8);
        storeBigEndian(frame.data() + 2, uint64_t(len));
    }
    frame.insert(frame.end(), key.begin(), key.end());

    auto offset = frame.size();
    frame.insert(frame.end(), payload.begin(), payload.end());
    applyMask(MutableBuffer(frame).subspan(offset), key);
    return frame;
}

auto encodeFrame(Opcode opcode, Buffer payload) -> ByteVector {
    return encodeFrame(opcode, payload, makeMaskKey());
}

auto parseFrame(Buffer data, size_t &consumed) -> std::optional<Frame> {
    if (data.size() < 2) {
        return std::nullopt;
    }
    auto b0 = std::to_integer<uint8_t>(data[0]);
    auto b1 = std::to_integer<uint8_t>(data[1]);

    Frame frame;
    frame.fin = (b0 & 0x80) != 0;
    frame.opcode = b0 & 0x0F;
    frame.masked = (b1 & 0x80) != 0;

    size_t header = 2;
    uint64_t len = b1 & 0x7F;
    if (len == 126) {
        if (data.size() < 4) {
            return std::nullopt;
        }
        len = loadBigEndian<uint16_t>(data.data() + 2);
        header = 4;
    }
    else if (len == 127) {
        if (data.size() < 10) {
            return std::nullopt;
        }
        len = loadBigEndian<uint64_t>(data.data() + 2);
        header = 10;
    }

    MaskKey key {};
    if (frame.masked) {
        if (data.size() < header + 4) {
            return std::nullopt;
        }
        std::copy_n(data.begin() + header, 4, key.begin());
        header += 4;
    }
    if (data.size() - header < len) {
        return std::nullopt;
    }

    auto payload = data.subspan(header, len);
    frame.payload.assign(payload.begin(), payload.end());
    if (frame.masked) {
        applyMask(frame.payload, key);
    }
    consumed = header + len;
    return frame;
}

auto makeClosePayload(uint16_t code, std::string_view reason) -> ByteVector {
    reason = reason.substr(0, MaxReasonLength);
    ByteVector payload(2 + reason.size());
    storeBigEndian(payload.data(), code);
    ::memcpy(payload.data() + 2, reason.data(), reason.size());
    return payload;
}

auto parseClosePayload(Buffer payload) -> std::pair<std::optional<uint16_t>, std::string> {
    if (payload.size() < 2) {
        return {std::nullopt, std::string {}};
    }
    auto code = loadBigEndian<uint16_t>(payload.data());
    return {code, std::string(asStringView(payload.subspan(2)))};
}

auto MessageAssembler::feed(Frame &&frame) -> std::optional<Message> {
    auto opcode = Opcode(frame.opcode);
    if (opcode == Opcode::Continuation) {
        if (!mOpcode) {
            SPEECHWS_WARN("Frame", "Continuation frame without a leading frame, dropped");
            return std::nullopt;
        }
        mFragments.emplace_back(std::move(frame.payload));
    }
    else {
        if (mOpcode) {
            SPEECHWS_WARN("Frame", "New message while {} fragments are pending, dropped the partial one", mFragments.size());
            reset();
        }
        if (frame.fin) {
            return Message {
                .binary = opcode == Opcode::Binary,
                .data = std::move(frame.payload)
            };
        }
        mOpcode = opcode;
        mFragments.emplace_back(std::move(frame.payload));
    }
    if (!frame.fin) {
        return std::nullopt;
    }

    // Concatenate in arrival order
    size_t total = 0;
    for (auto &fragment : mFragments) {
        total += fragment.size();
    }
    Message message;
    message.binary = *mOpcode == Opcode::Binary;
    message.data.reserve(total);
    for (auto &fragment : mFragments) {
        message.data.insert(message.data.end(), fragment.begin(), fragment.end());
    }
    reset();
    return message;
}

auto MessageAssembler::reset() -> void {
    mOpcode.reset();
    mFragments.clear();
}

} // namespace ws

SPEECHWS_NS_END
