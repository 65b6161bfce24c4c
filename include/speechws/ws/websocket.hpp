/**
 * @file websocket.hpp
 * @brief The client side websocket connection, upgrade handshake, frame dispatch and close
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/platform/epoll.hpp>
#include <speechws/net/transport.hpp>
#include <speechws/http/headers.hpp>
#include <speechws/ws/error.hpp>
#include <speechws/ws/frame.hpp>
#include <speechws/url.hpp>
#include <speechws/buffer.hpp>
#include <functional>
#include <chrono>
#include <memory>
#include <string>

SPEECHWS_NS_BEGIN

/**
 * @brief One outbound websocket connection, all events are delivered on the loop thread
 *
 * @note The handlers may call send() and close(), but must not destroy the object
 */
class SPEECHWS_API WebSocket final : private TransportListener {
public:
    enum State {
        Idle,       //< open() not called yet
        Connecting, //< Transport connecting or waiting for the 101
        Open,       //< Upgraded
        Closing,    //< close() called, waiting for the peer's close frame
        Closed,
    };

    struct Options {
        std::string host;   //< Host header override, the url host if empty
        std::string origin; //< Origin header, skipped if empty
        HttpHeaders headers; //< Extra headers, sent in order after the required ones
        std::chrono::milliseconds closeGracePeriod {1000};
        bool verifyPeer = true; //< Only used for the default tls transport
    };

    struct CloseInfo {
        uint16_t    code = ws::NoStatus;
        std::string reason;
        bool        wasClean = false; //< The peer sent a close frame

        auto toString() const -> std::string;
    };

    using SendCallback = std::function<void (IoResult<void>)>;
    using OpenHandler = std::function<void ()>;
    using MessageHandler = std::function<void (Buffer data, bool isBinary)>;
    using ErrorHandler = std::function<void (std::error_code ec)>;
    using CloseHandler = std::function<void (const CloseInfo &info)>;

    /**
     * @brief Construct with the default tls transport, created by open()
     *
     * @param loop
     */
    explicit WebSocket(EventLoop &loop);

    /**
     * @brief Construct on a custom transport
     *
     * @param loop
     * @param transport
     */
    WebSocket(EventLoop &loop, std::unique_ptr<Transport> transport);
    WebSocket(const WebSocket &) = delete;
    ~WebSocket();

    /**
     * @brief Start connecting and upgrading, the result is reported by the open or error handler
     *
     * @param url The wss url
     * @param options
     * @return IoResult<void> (WsError::BadUrl on a malformed url)
     */
    auto open(std::string_view url, Options options) -> IoResult<void>;
    auto open(std::string_view url) -> IoResult<void>;

    /**
     * @brief Send a text message as one frame
     *
     * @param text The utf-8 text
     * @param callback Called once the frame is written, or immediately with WsError::NotOpen / WsError::Closed
     */
    auto send(std::string_view text, SendCallback callback = {}) -> void;

    /**
     * @brief Send a binary message as one frame
     *
     * @param data
     * @param callback
     */
    auto send(Buffer data, SendCallback callback = {}) -> void;

    /**
     * @brief Start the close handshake, the transport is torn down after the grace period at most
     *
     */
    auto close() -> void;

    auto setOnOpen(OpenHandler handler) -> void { mOnOpen = std::move(handler); }
    auto setOnMessage(MessageHandler handler) -> void { mOnMessage = std::move(handler); }
    auto setOnError(ErrorHandler handler) -> void { mOnError = std::move(handler); }
    auto setOnClose(CloseHandler handler) -> void { mOnClose = std::move(handler); }

    auto state() const -> State { return mState; }

    ///> @brief The headers of the upgrade response (kept on a refused upgrade), empty before it arrived
    auto responseHeaders() const -> const HttpHeaders & { return mResponseHeaders; }

    ///> @brief How the connection ended, valid once closed
    auto closeInfo() const -> const CloseInfo & { return mCloseInfo; }
private:
    // TransportListener
    auto onConnected() -> void override;
    auto onData(Buffer data) -> void override;
    auto onError(std::error_code ec) -> void override;
    auto onClosed() -> void override;

    auto buildRequest(const Url &url) const -> std::string;
    auto handleHandshake() -> void;
    auto processFrames() -> void;
    auto handleFrame(ws::Frame &&frame) -> void;
    auto sendFrame(ws::Opcode opcode, Buffer payload, SendCallback callback) -> void;
    auto fail(std::error_code ec) -> void;
    auto finish(CloseInfo info, std::error_code ec = {}) -> void;

    EventLoop                 &mLoop;
    std::unique_ptr<Transport> mTransport;
    State                      mState = Idle;
    Options                    mOptions;
    std::string                mRequest;
    std::string                mKey; //< Sec-WebSocket-Key
    StreamBuffer               mInbound;
    ws::MessageAssembler       mAssembler;
    HttpHeaders                mResponseHeaders;
    CloseInfo                  mCloseInfo;
    EventLoop::TimerId         mGraceTimer = 0;

    OpenHandler    mOnOpen;
    MessageHandler mOnMessage;
    ErrorHandler   mOnError;
    CloseHandler   mOnClose;
};

SPEECHWS_NS_END
