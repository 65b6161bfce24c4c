/**
 * @file websocket.cpp
 * @brief The websocket connection state machine
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#include <speechws/ws/websocket.hpp>
#include <speechws/crypt.hpp>
#include <speechws/tls.hpp>
#include <speechws/log.hpp>
#include <iterator>

SPEECHWS_NS_BEGIN

using namespace std::literals;

// MARK: Category
auto WsCategory::name() const noexcept -> const char * {
    return "websocket";
}

auto WsCategory::message(int value) const -> std::string {
    switch (WsError(value)) {
        case WsError::Ok: return "Ok";
        case WsError::BadHandshake: return "The server refused the websocket upgrade";
        case WsError::NotOpen: return "The websocket is not open";
        case WsError::Closed: return "The websocket is closed";
        case WsError::BadUrl: return "Invalid websocket url";
        case WsError::InvalidSkewDate: return "Invalid server date";
        default: return "Unknown websocket error";
    }
}

auto WsCategory::instance() noexcept -> const WsCategory & {
    static constinit WsCategory instance;
    return instance;
}

auto WebSocket::CloseInfo::toString() const -> std::string {
    return fmtlib::format("CloseInfo {{ code: {}, reason: \"{}\", wasClean: {} }}", code, reason, wasClean);
}

// MARK: WebSocket
WebSocket::WebSocket(EventLoop &loop) : mLoop(loop) {

}

WebSocket::WebSocket(EventLoop &loop, std::unique_ptr<Transport> transport) :
    mLoop(loop), mTransport(std::move(transport))
{

}

WebSocket::~WebSocket() {
    if (mGraceTimer) {
        mLoop.cancelTimer(mGraceTimer);
    }
    if (mTransport && mState != Idle) {
        mTransport->destroy();
    }
}

auto WebSocket::open(std::string_view str, Options options) -> IoResult<void> {
    if (mState != Idle) {
        return Err(WsError::Closed);
    }
    auto url = Url(str);
    auto port = url.effectivePort();
    if (!url.isValid() || url.scheme() != "wss" || url.host().empty() || !port) {
        SPEECHWS_WARN("WebSocket", "Invalid websocket url: {}", str);
        return Err(WsError::BadUrl);
    }
    if (!mTransport) {
        auto ctxt = std::make_shared<TlsContext>(options.verifyPeer ? TlsContext::None : TlsContext::NoVerify);
        mTransport = std::make_unique<TlsTransport>(mLoop, std::move(ctxt));
    }
    mOptions = std::move(options);
    mKey = base64::encode(randomBytes(16));
    mRequest = buildRequest(url);
    mState = Connecting;
    SPEECHWS_DEBUG("WebSocket", "Connecting to {}:{}", url.host(), *port);
    mTransport->connect(url.host(), *port, this);
    return {};
}

auto WebSocket::open(std::string_view url) -> IoResult<void> {
    return open(url, Options {});
}

auto WebSocket::buildRequest(const Url &url) const -> std::string {
    std::string request;
    auto out = std::back_inserter(request);
    fmtlib::format_to(out, "GET {} HTTP/1.1\r\n", url.target());
    fmtlib::format_to(out, "Host: {}\r\n", mOptions.host.empty() ? url.host() : std::string_view(mOptions.host));
    if (!mOptions.origin.empty()) {
        fmtlib::format_to(out, "Origin: {}\r\n", mOptions.origin);
    }
    fmtlib::format_to(out, "Upgrade: websocket\r\n");
    fmtlib::format_to(out, "Connection: Upgrade\r\n");
    fmtlib::format_to(out, "Sec-WebSocket-Key: {}\r\n", mKey);
    fmtlib::format_to(out, "Sec-WebSocket-Version: 13\r\n");
    fmtlib::format_to(out, "{}\r\n", mOptions.headers);
    return request;
}

auto WebSocket::send(std::string_view text, SendCallback callback) -> void {
    sendFrame(ws::Opcode::Text, makeBuffer(text), std::move(callback));
}

auto WebSocket::send(Buffer data, SendCallback callback) -> void {
    sendFrame(ws::Opcode::Binary, data, std::move(callback));
}

auto WebSocket::sendFrame(ws::Opcode opcode, Buffer payload, SendCallback callback) -> void {
    if (mState != Open) {
        if (callback) {
            callback(Err(mState == Idle || mState == Connecting ? WsError::NotOpen : WsError::Closed));
        }
        return;
    }
    mTransport->write(ws::encodeFrame(opcode, payload), std::move(callback));
}

auto WebSocket::close() -> void {
    switch (mState) {
        case Idle:
            mState = Closed;
            return;
        case Connecting:
            // Nothing to acknowledge yet
            finish(CloseInfo {.code = ws::AbnormalClosure});
            return;
        case Open:
            break;
        case Closing:
        case Closed:
            return;
    }
    mState = Closing;
    auto payload = ws::makeClosePayload(ws::NormalClosure);
    mTransport->write(ws::encodeFrame(ws::Opcode::Close, payload), [](IoResult<void> res) {
        if (!res) {
            SPEECHWS_TRACE("WebSocket", "Failed to send close frame: {}", res.error().message());
        }
    });
    mGraceTimer = mLoop.callLater(mOptions.closeGracePeriod, [this]() {
        mGraceTimer = 0;
        SPEECHWS_DEBUG("WebSocket", "No close frame from the peer in {}, tear down", mOptions.closeGracePeriod);
        finish(CloseInfo {.code = ws::AbnormalClosure});
    });
}

// MARK: Transport events
auto WebSocket::onConnected() -> void {
    if (mState != Connecting) {
        return;
    }
    SPEECHWS_TRACE("WebSocket", "Transport connected, sending the upgrade request");
    auto request = std::move(mRequest);
    mTransport->write(toBytes(makeBuffer(request)), {});
}

auto WebSocket::onData(Buffer data) -> void {
    if (mState == Idle || mState == Closed) {
        return;
    }
    if (!mInbound.append(data)) {
        fail(IoError::MessageTooLarge);
        return;
    }
    if (mState == Connecting) {
        handleHandshake();
        return;
    }
    processFrames();
}

auto WebSocket::onError(std::error_code ec) -> void {
    fail(ec);
}

auto WebSocket::onClosed() -> void {
    if (mState == Connecting) {
        fail(IoError::UnexpectedEOF);
        return;
    }
    SPEECHWS_DEBUG("WebSocket", "Transport closed without a close frame");
    finish(CloseInfo {.code = ws::AbnormalClosure});
}

// MARK: Handshake
auto WebSocket::handleHandshake() -> void {
    auto view = asStringView(mInbound.data());
    auto end = view.find("\r\n\r\n");
    if (end == view.npos) {
        return; // Wait for the whole header block
    }
    auto block = view.substr(0, end);
    auto eol = block.find("\r\n");
    auto statusLine = block.substr(0, eol);
    if (eol != block.npos) {
        // Kept on failure too, the Date of a rejection feeds the skew correction
        mResponseHeaders = HttpHeaders::parse(block.substr(eol + 2));
    }
    if (statusLine.find("101") == statusLine.npos) {
        SPEECHWS_WARN("WebSocket", "Upgrade failed: {}", statusLine);
        fail(WsError::BadHandshake);
        return;
    }

    // Only logged, some proxies rewrite or strip the accept header
    auto accept = mKey + std::string(ws::MagicKey);
    auto expected = base64::encode(CryptoHash::hash(makeBuffer(accept), CryptoHash::Sha1));
    auto got = mResponseHeaders.value(HttpHeaders::SecWebSocketAccept);
    if (got != expected) {
        SPEECHWS_WARN("WebSocket", "Sec-WebSocket-Accept mismatch, expected {}, got '{}'", expected, got);
    }

    mInbound.consume(end + 4);
    mState = Open;
    SPEECHWS_DEBUG("WebSocket", "Upgraded, {} bytes of frames already arrived", mInbound.size());
    if (mOnOpen) {
        mOnOpen();
    }
    processFrames();
}

// MARK: Frames
auto WebSocket::processFrames() -> void {
    while (mState == Open || mState == Closing) {
        size_t consumed = 0;
        auto frame = ws::parseFrame(mInbound.data(), consumed);
        if (!frame) {
            break; // Need more bytes
        }
        mInbound.consume(consumed);
        handleFrame(std::move(*frame));
    }
}

auto WebSocket::handleFrame(ws::Frame &&frame) -> void {
    if (!ws::isKnown(frame.opcode)) {
        SPEECHWS_WARN("WebSocket", "Reserved opcode {:#x}, frame dropped", frame.opcode);
        return;
    }
    switch (ws::Opcode(frame.opcode)) {
        case ws::Opcode::Close: {
            auto [code, reason] = ws::parseClosePayload(frame.payload);
            SPEECHWS_DEBUG("WebSocket", "Close frame from the peer, code {}", code.value_or(ws::NoStatus));
            if (mState == Open) {
                // Echo the status code back, nothing if the peer sent none
                auto payload = code ? ws::makeClosePayload(*code) : ByteVector {};
                mTransport->write(ws::encodeFrame(ws::Opcode::Close, payload), [](IoResult<void> res) {
                    if (!res) {
                        SPEECHWS_TRACE("WebSocket", "Failed to reply close frame: {}", res.error().message());
                    }
                });
            }
            finish(CloseInfo {
                .code = code.value_or(ws::NoStatus),
                .reason = std::move(reason),
                .wasClean = true,
            });
            return;
        }
        case ws::Opcode::Ping: {
            if (mState != Open) {
                return;
            }
            mTransport->write(ws::encodeFrame(ws::Opcode::Pong, frame.payload), [](IoResult<void> res) {
                if (!res) {
                    SPEECHWS_TRACE("WebSocket", "Failed to send pong: {}", res.error().message());
                }
            });
            return;
        }
        case ws::Opcode::Pong:
            return;
        default:
            break;
    }

    auto message = mAssembler.feed(std::move(frame));
    if (!message || mState != Open) {
        return;
    }
    if (mOnMessage) {
        mOnMessage(message->data, message->binary);
    }
}

// MARK: Teardown
auto WebSocket::fail(std::error_code ec) -> void {
    if (mState == Closed) {
        return;
    }
    SPEECHWS_WARN("WebSocket", "Connection failed: {}", ec.message());
    finish(CloseInfo {.code = ws::AbnormalClosure}, ec);
}

auto WebSocket::finish(CloseInfo info, std::error_code ec) -> void {
    if (mState == Closed) {
        return;
    }
    mState = Closed;
    if (mGraceTimer) {
        mLoop.cancelTimer(mGraceTimer);
        mGraceTimer = 0;
    }
    mCloseInfo = std::move(info);
    mAssembler.reset();
    mInbound.clear();
    mTransport->destroy(); // Flushes a queued close or pong reply first

    // At most one error, then always one close
    if (ec && mOnError) {
        mOnError(ec);
    }
    if (mOnClose) {
        mOnClose(mCloseInfo);
    }
}

SPEECHWS_NS_END
