/**
 * @file buffer.hpp
 * @brief Byte views and the growable stream buffer
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/defines.hpp>
#include <algorithm>
#include <cstdlib>
#include <cstring> // memcpy
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <span>

SPEECHWS_NS_BEGIN

/**
 * @brief The byte const buffer view
 *
 */
using Buffer        = std::span<const std::byte>;

/**
 * @brief The byte mutable buffer view
 *
 */
using MutableBuffer = std::span<std::byte>;

/**
 * @brief The owning byte sequence, used for frames and messages
 *
 */
using ByteVector    = std::vector<std::byte>;

template <typename T>
concept IntoSpan = requires(T &t) {
    std::span(t);
};

template <typename T>
concept IntoBuffer = requires(T &t) {
    { makeBuffer(t) } -> std::convertible_to<Buffer>;
};

inline auto makeBuffer(const void *buf, size_t n) noexcept -> Buffer {
    return std::span(reinterpret_cast<const std::byte *>(buf), n);
}

inline auto makeBuffer(void *buf, size_t n) noexcept -> MutableBuffer {
    return std::span(reinterpret_cast<std::byte *>(buf), n);
}

template <IntoSpan T>
inline auto makeBuffer(const T &object) {
    auto span = std::span(object);
    return makeBuffer(span.data(), span.size_bytes());
}

template <IntoSpan T>
inline auto makeBuffer(T &object) {
    auto span = std::span(object);
    return makeBuffer(span.data(), span.size_bytes());
}

/**
 * @brief View the bytes as characters, no copy
 *
 * @param buf
 * @return std::string_view
 */
inline auto asStringView(Buffer buf) noexcept -> std::string_view {
    return std::string_view(reinterpret_cast<const char *>(buf.data()), buf.size());
}

/**
 * @brief Copy the bytes into an owning vector
 *
 * @param buf
 * @return ByteVector
 */
inline auto toBytes(Buffer buf) -> ByteVector {
    return ByteVector(buf.begin(), buf.end());
}

/**
 * @brief The growable buffer with an input window (readable bytes) and an output window (space to write)
 *
 */
class StreamBuffer {
public:
    StreamBuffer() = default;

    /**
     * @brief Construct a new Stream Buffer object with a max capacity
     *
     * @param maxCapacity The max capacity of the buffer
     */
    explicit StreamBuffer(size_t maxCapacity) : mMaxCapacity(maxCapacity) { }

    StreamBuffer(StreamBuffer &&other) noexcept :
        mBuffer(std::exchange(other.mBuffer, {})),
        mPos(std::exchange(other.mPos, 0)),
        mTail(std::exchange(other.mTail, 0)),
        mMaxCapacity(other.mMaxCapacity)
    {

    }

    StreamBuffer(const StreamBuffer &) = delete;

    ~StreamBuffer() {
        std::free(mBuffer.data());
    }

    /**
     * @brief Prepare a buffer for writing into the stream buffer (it make previous prepared buffer invalid)
     *
     * @param size The size of the buffer to prepare
     * @return MutableBuffer (empty on reaching the max capacity or out of memory)
     */
    auto prepare(size_t size) -> MutableBuffer {
        if (mPos == mTail) { //< Input window is empty, rewind
            mPos = 0;
            mTail = 0;
        }
        if (mPos != 0 && (mTail - mPos) < mBuffer.size() / 8) { //< Input window is small, move it to the front
            ::memmove(mBuffer.data(), mBuffer.data() + mPos, mTail - mPos);
            mTail -= mPos;
            mPos = 0;
        }
        if ((mTail - mPos) + size > mMaxCapacity) {
            return {};
        }
        if (mTail + size > mMaxCapacity) { //< Only fits after moving the input window to the front
            ::memmove(mBuffer.data(), mBuffer.data() + mPos, mTail - mPos);
            mTail -= mPos;
            mPos = 0;
        }
        auto space = mBuffer.size() - mTail;
        if (space < size) {
            auto newSize = std::min((mBuffer.size() + size) * 2, mMaxCapacity);
            auto newBuffer = static_cast<std::byte *>(std::realloc(mBuffer.data(), newSize));
            if (newBuffer == nullptr) {
                return {};
            }
            mBuffer = {newBuffer, newSize};
        }
        return mBuffer.subspan(mTail, size);
    }

    /**
     * @brief Commit the size of data from output window into the input window
     *
     * @param size The size of data to commit (can't exceed the prepared size)
     */
    auto commit(size_t size) -> void {
        SPEECHWS_ASSERT_MSG(size <= (mBuffer.size() - mTail), "Commit size exceed the capacity");
        mTail += std::min(size, mBuffer.size() - mTail);
    }

    /**
     * @brief Copy the bytes into the input window
     *
     * @param buf
     * @return true on success, false on reaching the max capacity
     */
    auto append(Buffer buf) -> bool {
        if (buf.empty()) {
            return true;
        }
        auto out = prepare(buf.size());
        if (out.size() < buf.size()) {
            return false;
        }
        ::memcpy(out.data(), buf.data(), buf.size());
        commit(buf.size());
        return true;
    }

    // Input Window
    auto data() const -> Buffer {
        return Buffer(mBuffer).subspan(mPos, mTail - mPos);
    }

    auto data() -> MutableBuffer {
        return mBuffer.subspan(mPos, mTail - mPos);
    }

    auto size() const -> size_t {
        return mTail - mPos;
    }

    auto empty() const -> bool {
        return mPos == mTail;
    }

    /**
     * @brief Consume the size of data from the input window
     *
     * @param size The size of data to consume (can't exceed the size of the input window)
     */
    auto consume(size_t size) -> void {
        SPEECHWS_ASSERT_MSG(size <= (mTail - mPos), "Consume size exceed the capacity");
        mPos += std::min(size, mTail - mPos);
    }

    /**
     * @brief Drop everything in the input window
     *
     */
    auto clear() -> void {
        mPos = 0;
        mTail = 0;
    }

    auto capacity() const -> size_t {
        return mBuffer.size();
    }

    auto maxCapacity() const -> size_t {
        return mMaxCapacity;
    }
private:
    MutableBuffer mBuffer;
    size_t mPos = 0; //< The begin of the input window
    size_t mTail = 0; //< The end of the input window, the output window starts here
    size_t mMaxCapacity = std::numeric_limits<size_t>::max();
};

namespace literals {
    inline auto operator""_bin(const char *buf, size_t len) -> Buffer {
        return {reinterpret_cast<const std::byte *>(buf), len};
    }
}

SPEECHWS_NS_END
