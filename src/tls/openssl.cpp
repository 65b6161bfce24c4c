#include <speechws/io/system_error.hpp>
#include <speechws/net/addrinfo.hpp>
#include <speechws/tls.hpp>
#include <speechws/log.hpp>
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>
#include <deque>
#include <array>

#include <openssl/x509.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <netinet/tcp.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

SPEECHWS_NS_BEGIN

namespace {

// Max TLS record size 2 ** 14 + header + trailer
constexpr size_t RecordSize = 16384 + 100;

// Pop the whole error queue, keep the first code as the error
auto takeTlsError() -> std::error_code {
    auto errc = std::error_code { IoError::Tls };
    if (auto c = ::ERR_peek_error(); c) {
        errc = { static_cast<int>(c), TlsCategory::instance() };
    }
    while (auto code = ::ERR_get_error()) {
        char buf[512] {0};
        ::ERR_error_string_n(code, buf, sizeof(buf));
        SPEECHWS_WARN("OpenSSL", "Tls Error: {} => {}", code, buf);
    }
    return errc;
}

auto bioMethod() -> BIO_METHOD *;

} // namespace

// MARK: Category
auto TlsCategory::name() const noexcept -> const char * {
    return "openssl";
}

auto TlsCategory::message(int code) const -> std::string {
    char buf[512] {0};
    ::ERR_error_string_n(static_cast<unsigned long>(code), buf, sizeof(buf));
    return buf;
}

auto TlsCategory::instance() noexcept -> const TlsCategory & {
    static constinit TlsCategory instance;
    return instance;
}

// MARK: Context
TlsContext::TlsContext(uint32_t flags) {
    auto ctxt = ::SSL_CTX_new(::TLS_client_method());
    if (!ctxt) {
        throw std::system_error(takeTlsError(), "SSL_CTX_new");
    }
    mCtxt = ctxt;
    SSL_CTX_set_min_proto_version(ctxt, TLS1_2_VERSION);
    setVerify(!(flags & NoVerify));
    if (!(flags & NoDefaultRootCerts)) {
        if (!loadDefaultRootCerts()) {
            SPEECHWS_WARN("OpenSSL", "Failed to load default root certificates");
        }
    }
}

TlsContext::TlsContext(TlsContext &&other) noexcept :
    mCtxt(std::exchange(other.mCtxt, nullptr)),
    mVerify(other.mVerify)
{

}

TlsContext::~TlsContext() {
    ::SSL_CTX_free(static_cast<SSL_CTX *>(mCtxt));
}

auto TlsContext::setVerify(bool verify) -> void {
    mVerify = verify;
    ::SSL_CTX_set_verify(static_cast<SSL_CTX *>(mCtxt), verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
}

auto TlsContext::loadDefaultRootCerts() -> bool {
    return ::SSL_CTX_set_default_verify_paths(static_cast<SSL_CTX *>(mCtxt)) == 1;
}

namespace {

// Add every PEM certificate the bio holds to the store, consumes the bio
auto addCertsFrom(SSL_CTX *ctxt, BIO *bio) -> bool {
    if (!bio) {
        ::ERR_clear_error();
        return false;
    }
    auto store = ::SSL_CTX_get_cert_store(ctxt);
    auto added = false;
    while (auto x509 = ::PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)) {
        if (::X509_STORE_add_cert(store, x509) != 1) {
            SPEECHWS_WARN("OpenSSL", "Failed to add certificate to store");
        }
        ::X509_free(x509);
        added = true;
    }
    ::BIO_free(bio);
    ::ERR_clear_error(); // The loop always ends with a "no start line" error
    return added;
}

} // namespace

auto TlsContext::loadRootCerts(Buffer pem) -> bool {
    return addCertsFrom(static_cast<SSL_CTX *>(mCtxt), ::BIO_new_mem_buf(pem.data(), int(pem.size())));
}

auto TlsContext::loadRootCertsFile(std::string_view path) -> bool {
    return addCertsFrom(static_cast<SSL_CTX *>(mCtxt), ::BIO_new_file(std::string(path).c_str(), "r"));
}

// MARK: Transport
class TlsTransport::Impl : public std::enable_shared_from_this<Impl> {
public:
    enum State {
        Idle,
        Connecting,
        Handshaking,
        Open,
        Closed,
    };

    Impl(EventLoop &loop, std::shared_ptr<TlsContext> ctxt) : mLoop(loop), mCtxt(std::move(ctxt)) { }
    ~Impl() {
        teardown(false);
    }

    // Callback from openssl
    auto bioRead(char *data, size_t len, size_t *ret) -> int {
        if (!data) {
            return 0;
        }
        BIO_clear_retry_flags(mBio);
        auto span = mReadBuffer.data();
        if (span.empty()) {
            BIO_set_retry_read(mBio);
            return -1;
        }
        len = std::min(len, span.size());
        ::memcpy(data, span.data(), len);
        mReadBuffer.consume(len);
        *ret = len;
        return 1;
    }

    auto bioWrite(const char *data, size_t len, size_t *ret) -> int {
        if (!data) {
            return 0;
        }
        BIO_clear_retry_flags(mBio);
        if (!mWriteBuffer.append(makeBuffer(data, len))) {
            BIO_set_retry_write(mBio);
            return -1;
        }
        mEncrypted += len;
        *ret = len;
        return 1;
    }

    auto bioCtrl(int cmd, [[maybe_unused]] long num, [[maybe_unused]] void *ptr) -> long {
        switch (cmd) {
            case BIO_CTRL_FLUSH: return 1; // We flush after every SSL call
            default: return 0;
        }
    }

    auto connect(std::string_view host, uint16_t port, TransportListener *listener) -> void {
        SPEECHWS_ASSERT(mState == Idle);
        mListener = listener;
        mHost = host;
        mPort = port;
        mState = Connecting;
        // Report everything from the loop, never inside the caller
        mLoop.post([weak = weak_from_this()]() {
            if (auto self = weak.lock(); self && self->mState == Connecting) {
                self->resolve();
            }
        });
    }

    auto write(ByteVector data, WriteCallback callback) -> void {
        if (mState == Closed) {
            if (callback) {
                mLoop.post([cb = std::move(callback)]() { cb(Err(IoError::SocketIsNotConnected)); });
            }
            return;
        }
        mPlain.push_back({std::move(data), std::move(callback)});
        if (mState == Open) {
            drive();
        }
    }

    auto resolve() -> void {
        auto weak = weak_from_this();
        AddressInfo::fromHostname(mLoop, mHost, std::to_string(mPort), [weak](IoResult<AddressInfo> info) {
            auto self = weak.lock();
            if (!self || self->mState != Connecting) { // Destroyed while resolving
                return;
            }
            if (!info) {
                self->fail(info.error());
                return;
            }
            self->mEndpoints = info->endpoints();
            self->mNextEndpoint = 0;
            self->tryNextEndpoint();
        });
    }

    // Try the endpoints in the resolver order, until one accepts the connection
    auto tryNextEndpoint() -> void {
        while (mNextEndpoint < mEndpoints.size()) {
            const auto &ep = mEndpoints[mNextEndpoint++];
            auto fd = ::socket(ep.family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, ep.protocol);
            if (fd == -1) {
                mLastError = SystemError::fromErrno();
                continue;
            }
            auto ret = ::connect(fd, ep.data(), ep.length);
            if (ret == -1 && errno != EINPROGRESS) {
                mLastError = SystemError::fromErrno();
                SPEECHWS_DEBUG("Tls", "Connect to {} failed: {}", ep, mLastError.message());
                ::close(fd);
                continue;
            }
            mFd = fd;
            if (auto res = watch(EPOLLOUT); !res) {
                mLastError = res.error();
                ::close(mFd);
                mFd = -1;
                continue;
            }
            SPEECHWS_DEBUG("Tls", "Connecting to {} ({})", ep, mHost);
            return;
        }
        fail(mLastError ? mLastError : std::error_code(IoError::HostUnreachable));
    }

    auto watch(uint32_t events) -> IoResult<void> {
        auto res = mLoop.addDescriptor(mFd, events, [weak = weak_from_this()](uint32_t revents) {
            if (auto self = weak.lock()) {
                self->onEvents(revents);
            }
        });
        if (res) {
            mEvents = events;
        }
        return res;
    }

    auto updateInterest() -> void {
        uint32_t want = EPOLLIN | (mWriteBuffer.empty() ? 0 : EPOLLOUT);
        if (want == mEvents || mFd == -1) {
            return;
        }
        if (auto res = mLoop.modifyDescriptor(mFd, want); !res) {
            fail(res.error());
            return;
        }
        mEvents = want;
    }

    auto onEvents(uint32_t revents) -> void {
        auto self = shared_from_this(); // The listener may drop the transport
        if (mState == Connecting) {
            onConnectReady();
            return;
        }
        if (revents & EPOLLOUT) {
            if (!flushSocket()) {
                return;
            }
        }
        if (revents & (EPOLLIN | EPOLLERR | EPOLLHUP)) {
            if (!readSocket()) {
                return;
            }
        }
        drive();
    }

    auto onConnectReady() -> void {
        int err = 0;
        ::socklen_t len = sizeof(err);
        if (::getsockopt(mFd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
            err = errno;
        }
        if (err != 0) {
            mLastError = SystemError(err);
            SPEECHWS_DEBUG("Tls", "Connect failed: {}", mLastError.message());
            closeSocket();
            tryNextEndpoint();
            return;
        }
        int one = 1;
        if (::setsockopt(mFd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) == -1) {
            SPEECHWS_TRACE("Tls", "Failed to set TCP_NODELAY: {}", SystemError::fromErrno());
        }

        // Bind ssl to our bio
        mSsl = ::SSL_new(static_cast<SSL_CTX *>(mCtxt->native()));
        mBio = ::BIO_new(bioMethod());
        if (!mSsl || !mBio) {
            ::BIO_free(mBio);
            mBio = nullptr;
            fail(takeTlsError());
            return;
        }
        ::BIO_set_data(mBio, this);
        ::BIO_set_init(mBio, 1);
        ::BIO_set_shutdown(mBio, 0);
        ::SSL_set_bio(mSsl, mBio, mBio);
        SSL_set_tlsext_host_name(mSsl, mHost.c_str());
        if (mCtxt->verify()) {
            ::SSL_set1_host(mSsl, mHost.c_str());
        }
        ::SSL_set_connect_state(mSsl);
        mState = Handshaking;
        updateInterest();
        if (mState == Handshaking) {
            drive();
        }
    }

    // Read all available ciphertext from the socket, false on failed
    auto readSocket() -> bool {
        while (!mEof) {
            auto buf = mReadBuffer.prepare(RecordSize);
            if (buf.empty()) {
                fail(IoError::NoBufferSpaceAvailable);
                return false;
            }
            auto n = ::recv(mFd, buf.data(), buf.size(), 0);
            if (n > 0) {
                mReadBuffer.commit(size_t(n));
                if (size_t(n) < buf.size()) {
                    break;
                }
                continue;
            }
            if (n == 0) {
                SPEECHWS_DEBUG("Tls", "Tcp Stream: EOF");
                mEof = true;
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            fail(SystemError::fromErrno());
            return false;
        }
        return true;
    }

    // Send the ciphertext as much as the socket accepts, false on failed
    auto flushSocket() -> bool {
        while (!mWriteBuffer.empty()) {
            auto data = mWriteBuffer.data();
            auto n = ::send(mFd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n > 0) {
                mWriteBuffer.consume(size_t(n));
                mFlushed += uint64_t(n);
                continue;
            }
            if (n == -1 && errno == EINTR) {
                continue;
            }
            if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK) {
                fail(SystemError::fromErrno());
                return false;
            }
            break;
        }
        // Complete the writes whose last byte is handed to the kernel
        while (!mInflight.empty() && mInflight.front().first <= mFlushed) {
            if (auto cb = std::move(mInflight.front().second); cb) {
                mLoop.post([cb = std::move(cb)]() { cb({}); });
            }
            mInflight.pop_front();
        }
        updateInterest();
        return mState != Closed;
    }

    // Pump the ssl state machine, it calls the listener
    auto drive() -> void {
        if (mInDrive) {
            mDirty = true;
            return;
        }
        auto self = shared_from_this();
        mInDrive = true;
        do {
            mDirty = false;
            if (mState == Handshaking && !handshake()) {
                break;
            }
            if (mState != Open) {
                break;
            }
            if (!encrypt() || !flushSocket()) {
                break;
            }
            auto closed = false;
            if (!decrypt(closed) || !flushSocket()) {
                break;
            }
            if (closed) {
                peerClosed();
                break;
            }
        }
        while (mDirty && mState == Open);
        mInDrive = false;
    }

    // Continue the handshake, false if not done yet or failed
    auto handshake() -> bool {
        auto ret = ::SSL_do_handshake(mSsl);
        if (ret != 1) {
            auto err = ::SSL_get_error(mSsl, ret);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                if (!flushSocket()) {
                    return false;
                }
                if (mEof) {
                    fail(IoError::UnexpectedEOF);
                }
                return false;
            }
            fail(sslError(err));
            return false;
        }
        SPEECHWS_DEBUG("Tls", "Handshake with {} done, {}", mHost, ::SSL_get_version(mSsl));
        mState = Open;
        if (!flushSocket()) {
            return false;
        }
        mListener->onConnected();
        return mState == Open;
    }

    // Encrypt the queued plain writes into the write buffer
    auto encrypt() -> bool {
        while (!mPlain.empty()) {
            auto &front = mPlain.front();
            if (!front.data.empty()) {
                size_t written = 0;
                auto ret = ::SSL_write_ex(mSsl, front.data.data(), front.data.size(), &written);
                if (ret != 1) {
                    auto err = ::SSL_get_error(mSsl, ret);
                    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                        return true; // Retry with the same buffer later
                    }
                    fail(sslError(err));
                    return false;
                }
            }
            mInflight.emplace_back(mEncrypted, std::move(front.callback));
            mPlain.pop_front();
        }
        return true;
    }

    // Decrypt and deliver all the available records
    auto decrypt(bool &closed) -> bool {
        while (mState == Open) {
            size_t readed = 0;
            auto ret = ::SSL_read_ex(mSsl, mPlainBuffer.data(), mPlainBuffer.size(), &readed);
            if (ret == 1) {
                mListener->onData(Buffer(mPlainBuffer.data(), readed));
                continue;
            }
            auto err = ::SSL_get_error(mSsl, ret);
            if (err == SSL_ERROR_WANT_READ) {
                closed = mEof; // No close_notify, but the peer is gone
                return true;
            }
            if (err == SSL_ERROR_WANT_WRITE) {
                return true;
            }
            if (err == SSL_ERROR_ZERO_RETURN) {
                SPEECHWS_DEBUG("Tls", "Tls Stream: EOF");
                closed = true;
                return true;
            }
            fail(sslError(err));
            return false;
        }
        return false;
    }

    auto sslError(int err) -> std::error_code {
        if (err == SSL_ERROR_SSL) {
            mFail = true; // Not recoverable, no SSL_shutdown after it
            return takeTlsError();
        }
        if (err == SSL_ERROR_SYSCALL && errno != 0) {
            return SystemError::fromErrno();
        }
        return IoError::Tls;
    }

    auto peerClosed() -> void {
        auto listener = mListener;
        teardown(false);
        if (listener) {
            listener->onClosed();
        }
    }

    auto fail(std::error_code ec) -> void {
        if (mState == Closed) {
            return;
        }
        SPEECHWS_DEBUG("Tls", "Transport to {} failed: {}", mHost, ec.message());
        // The writes still queued never reach the peer
        for (auto &[mark, cb] : mInflight) {
            if (cb) {
                mLoop.post([cb = std::move(cb), ec]() { cb(Err(ec)); });
            }
        }
        for (auto &item : mPlain) {
            if (item.callback) {
                mLoop.post([cb = std::move(item.callback), ec]() { cb(Err(ec)); });
            }
        }
        mInflight.clear();
        mPlain.clear();
        auto listener = mListener;
        teardown(false);
        if (listener) {
            listener->onError(ec);
        }
    }

    auto closeSocket() -> void {
        if (mFd == -1) {
            return;
        }
        if (auto res = mLoop.removeDescriptor(mFd); !res) {
            SPEECHWS_TRACE("Tls", "Failed to remove fd {}: {}", mFd, res.error().message());
        }
        ::close(mFd);
        mFd = -1;
        mEvents = 0;
    }

    // Send as much of the ciphertext as the socket takes right now, never waits
    auto flushOnTeardown() -> void {
        while (!mWriteBuffer.empty()) {
            auto data = mWriteBuffer.data();
            auto n = ::send(mFd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n > 0) {
                mWriteBuffer.consume(size_t(n));
                continue;
            }
            if (n == -1 && errno == EINTR) {
                continue;
            }
            if (n == -1) {
                SPEECHWS_TRACE("Tls", "Dropped {} bytes on teardown: {}", data.size(), SystemError::fromErrno());
            }
            break;
        }
    }

    auto teardown(bool graceful) -> void {
        if (graceful && mState == Open && mSsl && !mFail) {
            mListener = nullptr; // No events while flushing

            // The writes queued so far go out before the close_notify, their callbacks are dropped
            for (auto &item : mPlain) {
                size_t written = 0;
                if (!item.data.empty() && ::SSL_write_ex(mSsl, item.data.data(), item.data.size(), &written) != 1) {
                    SPEECHWS_TRACE("Tls", "Failed to encrypt {} queued bytes on teardown", item.data.size());
                    ::ERR_clear_error();
                    break;
                }
            }

            // Best effort close_notify, no waiting for the peer
            if (::SSL_shutdown(mSsl) < 0) {
                ::ERR_clear_error();
            }
            flushOnTeardown();
        }
        mState = Closed;
        mListener = nullptr;
        closeSocket();
        if (mSsl) {
            ::SSL_free(mSsl); // Free the bio too
            mSsl = nullptr;
            mBio = nullptr;
        }
        mPlain.clear();
        mInflight.clear();
        mReadBuffer.clear();
        mWriteBuffer.clear();
    }
private:
    struct PendingWrite {
        ByteVector data;
        WriteCallback callback;
    };

    EventLoop                   &mLoop;
    std::shared_ptr<TlsContext>  mCtxt;
    TransportListener           *mListener = nullptr;
    State                        mState = Idle;
    std::string                  mHost;
    uint16_t                     mPort = 0;

    // Connect State
    std::vector<Endpoint>        mEndpoints;
    size_t                       mNextEndpoint = 0;
    std::error_code              mLastError;
    fd_t                         mFd = -1;
    uint32_t                     mEvents = 0;

    // OpenSSL State
    SSL                         *mSsl = nullptr;
    BIO                         *mBio = nullptr;
    bool                         mFail = false; // Not recoverable SSL Fail
    bool                         mEof = false;
    bool                         mInDrive = false;
    bool                         mDirty = false;

    // Buffer
    StreamBuffer                 mReadBuffer;  //< The ciphertext from the socket
    StreamBuffer                 mWriteBuffer; //< The ciphertext to the socket
    std::array<std::byte, RecordSize> mPlainBuffer;
    uint64_t                     mEncrypted = 0; //< Total ciphertext produced
    uint64_t                     mFlushed = 0;   //< Total ciphertext sent
    std::deque<PendingWrite>     mPlain;  //< Not encrypted yet
    std::deque<std::pair<uint64_t, WriteCallback> > mInflight; //< Encrypted, waiting the sent total reach the mark
};

namespace {

struct BioMethodHolder {
    BioMethodHolder() {
        method = ::BIO_meth_new(::BIO_get_new_index() | BIO_TYPE_SOURCE_SINK, "speechws::TlsTransport");
        ::BIO_meth_set_write_ex(method, [](BIO *b, const char *data, size_t len, size_t *ret) {
            return static_cast<TlsTransport::Impl*>(::BIO_get_data(b))->bioWrite(data, len, ret);
        });
        ::BIO_meth_set_read_ex(method, [](BIO *b, char *data, size_t len, size_t *ret) {
            return static_cast<TlsTransport::Impl*>(::BIO_get_data(b))->bioRead(data, len, ret);
        });
        ::BIO_meth_set_ctrl(method, [](BIO *b, int cmd, long num, void *ptr) {
            return static_cast<TlsTransport::Impl*>(::BIO_get_data(b))->bioCtrl(cmd, num, ptr);
        });
    }
    ~BioMethodHolder() {
        ::BIO_meth_free(method);
    }
    BIO_METHOD *method = nullptr;
};

auto bioMethod() -> BIO_METHOD * {
    static BioMethodHolder holder;
    return holder.method;
}

} // namespace

TlsTransport::TlsTransport(EventLoop &loop, std::shared_ptr<TlsContext> ctxt) :
    d(std::make_shared<Impl>(loop, std::move(ctxt)))
{

}

TlsTransport::~TlsTransport() {
    d->teardown(false);
}

auto TlsTransport::connect(std::string_view host, uint16_t port, TransportListener *listener) -> void {
    d->connect(host, port, listener);
}

auto TlsTransport::write(ByteVector data, WriteCallback callback) -> void {
    d->write(std::move(data), std::move(callback));
}

auto TlsTransport::destroy() -> void {
    d->teardown(true);
}

SPEECHWS_NS_END
