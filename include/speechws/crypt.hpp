/**
 * @file crypt.hpp
 * @brief base64, hex, message digests and random bytes (digests and randomness come from OpenSSL)
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/io/error.hpp>
#include <speechws/buffer.hpp>
#include <string_view>
#include <string>
#include <vector>
#include <array>
#include <span>
#include <bit>

SPEECHWS_NS_BEGIN

namespace base64 {

inline constexpr auto chars = std::string_view {"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

inline constexpr auto invchars = []() consteval {
    std::array<std::byte, 256> ret;
    for (size_t i = 0; i < ret.size(); ++i) {
        ret[i] = std::byte{0xff};
    }
    for (size_t i = 0; i < chars.size(); ++i) {
        ret[static_cast<uint8_t>(chars[i])] = std::byte(i);
    }
    // = as 0
    ret['='] = std::byte{0};
    return ret;
}();

inline constexpr auto encodeLength(Buffer data) noexcept -> size_t {
    return (data.size() + 2) / 3 * 4;
}

/**
 * @brief Encode the data to base64
 *
 * @param in The input data
 * @param out The output buffer (must be at least encodeLength(in) bytes long)
 * @return size_t The length of the encoded data, 0 on a too small output
 */
inline constexpr auto encodeTo(Buffer in, std::span<char> out) noexcept -> size_t {
    if (out.size() < encodeLength(in)) {
        return 0;
    }
    size_t idx = 0;
    size_t outIdx = 0;

    for (; idx + 3 <= in.size(); idx += 3) {
        uint32_t tmp =
            std::to_integer<uint32_t>(in[idx    ]) << 16 |
            std::to_integer<uint32_t>(in[idx + 1]) <<  8 |
            std::to_integer<uint32_t>(in[idx + 2]);
        out[outIdx++] = chars[(tmp >> 18) & 0x3f];
        out[outIdx++] = chars[(tmp >> 12) & 0x3f];
        out[outIdx++] = chars[(tmp >> 6) & 0x3f];
        out[outIdx++] = chars[tmp & 0x3f];
    }

    if (idx < in.size()) { // Padding =
        uint32_t tmp = std::to_integer<uint32_t>(in[idx]) << 16;
        if (idx + 1 < in.size()) {
            tmp |= std::to_integer<uint32_t>(in[idx + 1]) << 8;
        }
        out[outIdx++] = chars[(tmp >> 18) & 0x3f];
        out[outIdx++] = chars[(tmp >> 12) & 0x3f];
        out[outIdx++] = (idx + 1 < in.size()) ? chars[(tmp >> 6) & 0x3f] : '=';
        out[outIdx++] = '=';
    }
    return outIdx;
}

inline auto encode(Buffer in) -> std::string {
    std::string buf(encodeLength(in), '\0');
    buf.resize(encodeTo(in, buf));
    return buf;
}

inline constexpr auto decodeLength(std::string_view encoded) noexcept -> size_t {
    if (encoded.size() % 4 != 0) {
        return 0;
    }
    size_t padding = 0;
    if (!encoded.empty()) {
        if (encoded.back() == '=') padding++;
        if (encoded.size() > 1 && encoded[encoded.size() - 2] == '=') padding++;
    }
    return (encoded.size() * 3) / 4 - padding;
}

/**
 * @brief Decode the base64 encoded data to binary
 *
 * @param in
 * @param out (must be at least decodeLength(in) bytes long)
 * @return size_t The decoded length, 0 on malformed input
 */
inline constexpr auto decodeTo(std::string_view in, MutableBuffer out) noexcept -> size_t {
    if (in.size() % 4 != 0 || out.size() < decodeLength(in)) {
        return 0;
    }
    size_t outIdx = 0;
    for (size_t idx = 0; idx + 4 <= in.size(); idx += 4) {
        auto a = invchars[std::bit_cast<uint8_t>(in[idx    ])];
        auto b = invchars[std::bit_cast<uint8_t>(in[idx + 1])];
        auto c = invchars[std::bit_cast<uint8_t>(in[idx + 2])];
        auto d = invchars[std::bit_cast<uint8_t>(in[idx + 3])];

        if (in[idx] == '=' || in[idx + 1] == '=') { // First two chars can't be padding
            return 0;
        }
        if (a == std::byte{0xff} || b == std::byte{0xff} || c == std::byte{0xff} || d == std::byte{0xff}) {
            return 0;
        }

        uint32_t tmp =
            std::to_integer<uint32_t>(a) << 18 |
            std::to_integer<uint32_t>(b) << 12 |
            std::to_integer<uint32_t>(c) << 6 |
            std::to_integer<uint32_t>(d);

        out[outIdx++] = std::byte((tmp >> 16) & 0xff);
        if (in[idx + 2] != '=') {
            out[outIdx++] = std::byte((tmp >> 8) & 0xff);
        }
        if (in[idx + 3] != '=') {
            out[outIdx++] = std::byte(tmp & 0xff);
        }
    }
    return outIdx;
}

inline auto decode(std::string_view in) -> ByteVector {
    ByteVector buf(decodeLength(in));
    buf.resize(decodeTo(in, buf));
    return buf;
}

} // namespace base64

namespace hex {

enum Case {
    Upper,
    Lower
};

/**
 * @brief Render the bytes as hex, two chars per byte
 *
 * @param data
 * @param c The letter case of a-f
 * @return std::string
 */
inline auto encode(Buffer data, Case c = Upper) -> std::string {
    constexpr std::string_view upper = "0123456789ABCDEF";
    constexpr std::string_view lower = "0123456789abcdef";
    auto table = (c == Upper) ? upper : lower;
    std::string out;
    out.reserve(data.size() * 2);
    for (auto byte : data) {
        auto v = std::to_integer<uint8_t>(byte);
        out.push_back(table[v >> 4]);
        out.push_back(table[v & 0x0f]);
    }
    return out;
}

} // namespace hex

/**
 * @brief The message digest, backed by OpenSSL EVP
 *
 */
class SPEECHWS_API CryptoHash {
public:
    enum Type {
        Sha1,
        Sha256,
        Sha512,
        Md5,
        NumTypes // Number of types, Internal use only
    };

    explicit CryptoHash(Type type);
    CryptoHash(const CryptoHash &) = delete;
    CryptoHash(CryptoHash &&other) noexcept;
    ~CryptoHash();

    /**
     * @brief Add data to the hash
     *
     * @param data
     */
    auto addData(Buffer data) -> void;

    /**
     * @brief Reset the object, clear the previous result, and ready to add new data
     *
     */
    auto reset() -> void;

    /**
     * @brief Finish the digest, the object must be reset before adding new data
     *
     * @return ByteVector (hashLength(type) bytes)
     */
    auto result() -> ByteVector;

    static auto hash(Buffer data, Type type) -> ByteVector;
    static auto hashLength(Type type) -> size_t;
private:
    void *mCtxt = nullptr; // EVP_MD_CTX
    Type  mType;
};

/**
 * @brief Fill the buffer from the cryptographically secure generator
 *
 * @param out
 * @return IoResult<void> (IoError::Tls when the generator is not seeded)
 */
extern auto SPEECHWS_API randomBytes(MutableBuffer out) -> IoResult<void>;

/**
 * @brief Generate n random bytes, fallback to std::random_device when OpenSSL fails
 *
 * @param n
 * @return ByteVector
 */
extern auto SPEECHWS_API randomBytes(size_t n) -> ByteVector;

SPEECHWS_NS_END
