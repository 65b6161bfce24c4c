/**
 * @file transport.hpp
 * @brief The asynchronous byte stream a websocket runs on
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
#include <functional>
#include <cstdint>

SPEECHWS_NS_BEGIN

/**
 * @brief The receiver of the transport events, all of them are called on the event loop thread
 *
 */
class TransportListener {
public:
    virtual ~TransportListener() = default;

    ///> @brief The stream is connected (and secured), writes are accepted now
    virtual auto onConnected() -> void = 0;
    ///> @brief Some bytes arrived, the view is only valid in the call
    virtual auto onData(Buffer data) -> void = 0;
    ///> @brief The stream failed, no more events after it
    virtual auto onError(std::error_code ec) -> void = 0;
    ///> @brief The peer closed the stream, no more events after it
    virtual auto onClosed() -> void = 0;
};

/**
 * @brief The abstract byte transport, the websocket owns one
 *
 */
class Transport {
public:
    using WriteCallback = std::function<void(IoResult<void>)>;

    virtual ~Transport() = default;

    /**
     * @brief Start connecting to host:port, the result is reported to the listener
     *
     * @param host
     * @param port
     * @param listener Must outlive the transport or a destroy() call
     */
    virtual auto connect(std::string_view host, uint16_t port, TransportListener *listener) -> void = 0;

    /**
     * @brief Queue the bytes for writing, the callback fires once they are handed to the kernel or on failure
     *
     * @param data
     * @param callback (may be empty)
     */
    virtual auto write(ByteVector data, WriteCallback callback) -> void = 0;

    /**
     * @brief Tear the stream down, no more listener events after it
     * @note The writes already queued are flushed on a best-effort basis before the close_notify,
     * their callbacks are dropped
     *
     */
    virtual auto destroy() -> void = 0;
};

SPEECHWS_NS_END
