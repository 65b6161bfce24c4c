#include <speechws/net/addrinfo.hpp>
#include <speechws/tls.hpp>
#include <speechws/log.hpp>
#include <gtest/gtest.h>
#include <optional>
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#include <openssl/x509.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/ec.h>
#include <openssl/pem.h>
#include <openssl/bio.h>

#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

using namespace SPEECHWS_NAMESPACE;
using namespace std::literals;

// A loopback port nobody listens on
auto closedPort() -> uint16_t {
    auto fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ::sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = ::htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::socklen_t len = sizeof(addr);
    if (::bind(fd, reinterpret_cast<::sockaddr *>(&addr), sizeof(addr)) != 0 ||
        ::getsockname(fd, reinterpret_cast<::sockaddr *>(&addr), &len) != 0)
    {
        ::close(fd);
        return 0;
    }
    ::close(fd);
    return ::ntohs(addr.sin_port);
}

class Recorder final : public TransportListener {
public:
    explicit Recorder(EventLoop &loop) : mLoop(loop) { }

    auto onConnected() -> void override { connected = true; mLoop.stop(); }
    auto onData(Buffer) -> void override { }
    auto onError(std::error_code ec) -> void override { error = ec; mLoop.stop(); }
    auto onClosed() -> void override { closed = true; mLoop.stop(); }

    bool connected = false;
    bool closed = false;
    std::optional<std::error_code> error;
private:
    EventLoop &mLoop;
};

// One shot TLS server on loopback with a self signed certificate, greets and collects what the client sends
// Self signed "localhost" certificate, valid for one hour
auto makeCertificate(EVP_PKEY *pkey) -> X509 * {
    auto x509 = ::X509_new();
    ::X509_set_version(x509, 2);
    ::ASN1_INTEGER_set(::X509_get_serialNumber(x509), 1);
    ::X509_gmtime_adj(::X509_getm_notBefore(x509), 0);
    ::X509_gmtime_adj(::X509_getm_notAfter(x509), 3600);
    ::X509_set_pubkey(x509, pkey);
    auto name = ::X509_get_subject_name(x509);
    ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char *>("localhost"), -1, -1, 0);
    ::X509_set_issuer_name(x509, name);
    ::X509_sign(x509, pkey, ::EVP_sha256());
    return x509;
}

class LoopbackServer {
public:
    LoopbackServer() {
        mCtxt = makeContext();
        mFd = ::socket(AF_INET, SOCK_STREAM, 0);
        ::sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = ::htonl(INADDR_LOOPBACK);
        ::socklen_t len = sizeof(addr);
        if (::bind(mFd, reinterpret_cast<::sockaddr *>(&addr), sizeof(addr)) != 0 ||
            ::listen(mFd, 1) != 0 ||
            ::getsockname(mFd, reinterpret_cast<::sockaddr *>(&addr), &len) != 0)
        {
            return;
        }
        setTimeout(mFd);
        mPort = ::ntohs(addr.sin_port);
        mThread = std::thread([this]() { serve(); });
    }

    ~LoopbackServer() {
        join();
        ::close(mFd);
        ::SSL_CTX_free(mCtxt);
    }

    auto port() const -> uint16_t { return mPort; }

    ///> @brief Wait the client to go, then get the plain text it sent
    auto received() -> std::string {
        join();
        return mReceived;
    }
private:
    static auto makeContext() -> SSL_CTX * {
        auto pkey = EVP_EC_gen("P-256");
        auto x509 = makeCertificate(pkey);

        auto ctxt = ::SSL_CTX_new(::TLS_server_method());
        ::SSL_CTX_use_certificate(ctxt, x509);
        ::SSL_CTX_use_PrivateKey(ctxt, pkey);
        ::X509_free(x509);
        ::EVP_PKEY_free(pkey);
        return ctxt;
    }

    static auto setTimeout(int fd) -> void {
        ::timeval tv {.tv_sec = 5, .tv_usec = 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    auto serve() -> void {
        auto fd = ::accept(mFd, nullptr, nullptr);
        if (fd == -1) {
            return;
        }
        setTimeout(fd);
        auto ssl = ::SSL_new(mCtxt);
        ::SSL_set_fd(ssl, fd);
        if (::SSL_accept(ssl) == 1 && ::SSL_write(ssl, "hello", 5) == 5) {
            char buf[256];
            int n = 0;
            while ((n = ::SSL_read(ssl, buf, sizeof(buf))) > 0) { // Until close_notify or EOF
                mReceived.append(buf, size_t(n));
            }
        }
        ::SSL_free(ssl);
        ::close(fd);
    }

    auto join() -> void {
        if (mThread.joinable()) {
            mThread.join();
        }
    }

    SSL_CTX    *mCtxt = nullptr;
    int         mFd = -1;
    uint16_t    mPort = 0;
    std::string mReceived;
    std::thread mThread;
};

// Answers the greeting and tears the transport down inside the same data event
class AnswerThenDestroy final : public TransportListener {
public:
    AnswerThenDestroy(EventLoop &loop, Transport &transport) : mLoop(loop), mTransport(transport) { }

    auto onConnected() -> void override { connected = true; }
    auto onData(Buffer data) -> void override {
        greeting += asStringView(data);
        if (greeting != "hello") {
            return;
        }
        mTransport.write(toBytes(makeBuffer("bye"sv)), [this](IoResult<void>) { callbackFired = true; });
        mTransport.destroy();
        mLoop.stop();
    }
    auto onError(std::error_code ec) -> void override { error = ec; mLoop.stop(); }
    auto onClosed() -> void override { mLoop.stop(); }

    bool connected = false;
    bool callbackFired = false;
    std::string greeting;
    std::optional<std::error_code> error;
private:
    EventLoop &mLoop;
    Transport &mTransport;
};

TEST(Tls, Context) {
    TlsContext ctxt(TlsContext::NoDefaultRootCerts);
    ASSERT_NE(ctxt.native(), nullptr);
    ASSERT_TRUE(ctxt.verify());
    ctxt.setVerify(false);
    ASSERT_FALSE(ctxt.verify());
    ASSERT_FALSE(ctxt.loadRootCerts(makeBuffer("not a certificate"sv)));

    TlsContext noVerify(TlsContext::NoVerify | TlsContext::NoDefaultRootCerts);
    ASSERT_FALSE(noVerify.verify());
}

TEST(Tls, RootCertsFile) {
    TlsContext ctxt(TlsContext::NoDefaultRootCerts);
    ASSERT_FALSE(ctxt.loadRootCertsFile("/nonexistent/speechws/roots.pem"));

    char path[] = "/tmp/speechws_roots_XXXXXX";
    auto fd = ::mkstemp(path);
    ASSERT_NE(fd, -1);
    ::close(fd);

    auto pkey = EVP_EC_gen("P-256");
    auto x509 = makeCertificate(pkey);
    auto bio = ::BIO_new_file(path, "w");
    ASSERT_NE(bio, nullptr);
    ASSERT_EQ(::PEM_write_bio_X509(bio, x509), 1);
    ::BIO_free(bio);
    ::X509_free(x509);
    ::EVP_PKEY_free(pkey);

    ASSERT_TRUE(ctxt.loadRootCertsFile(path));
    ::unlink(path);

    // Empty file, nothing to add
    TlsContext empty(TlsContext::NoDefaultRootCerts);
    ASSERT_FALSE(empty.loadRootCertsFile("/dev/null"));
}

TEST(Tls, ConnectRefused) {
    auto port = closedPort();
    ASSERT_NE(port, 0);

    EventLoop loop;
    auto guard = loop.callLater(5s, [&]() {
        ADD_FAILURE() << "Timeout";
        loop.stop();
    });
    Recorder recorder(loop);
    TlsTransport transport(loop, std::make_shared<TlsContext>(TlsContext::NoDefaultRootCerts));
    transport.connect("127.0.0.1", port, &recorder);
    loop.run();
    loop.cancelTimer(guard);

    ASSERT_FALSE(recorder.connected);
    ASSERT_TRUE(recorder.error);
    ASSERT_EQ(*recorder.error, std::errc::connection_refused) << recorder.error->message();

    // Writes after the failure are rejected
    std::optional<IoResult<void> > result;
    transport.write(toBytes(makeBuffer("data"sv)), [&](IoResult<void> res) {
        result = res;
        loop.stop();
    });
    loop.run();
    ASSERT_TRUE(result);
    ASSERT_FALSE(*result);
}

TEST(Tls, ResolveFailure) {
    auto info = AddressInfo::fromHostnameBlocking("127.0.0.1", "https"); // Only numeric ports
    ASSERT_FALSE(info);
    ASSERT_STREQ(info.error().category().name(), "getaddrinfo");
    std::cout << info.error().message() << std::endl;

    auto local = AddressInfo::fromHostnameBlocking("127.0.0.1", "443");
    ASSERT_TRUE(local) << local.error().message();
    auto endpoints = local->endpoints();
    ASSERT_FALSE(endpoints.empty());
    ASSERT_EQ(endpoints[0].toString(), "127.0.0.1:443");
}

TEST(Tls, QueuedWriteFlushedOnDestroy) {
    LoopbackServer server;
    ASSERT_NE(server.port(), 0);

    EventLoop loop;
    auto guard = loop.callLater(5s, [&]() {
        ADD_FAILURE() << "Timeout";
        loop.stop();
    });
    TlsTransport transport(loop, std::make_shared<TlsContext>(TlsContext::NoVerify | TlsContext::NoDefaultRootCerts));
    AnswerThenDestroy listener(loop, transport);
    transport.connect("127.0.0.1", server.port(), &listener);
    loop.run();
    loop.cancelTimer(guard);

    ASSERT_FALSE(listener.error) << listener.error->message();
    ASSERT_TRUE(listener.connected);
    ASSERT_EQ(listener.greeting, "hello");
    ASSERT_EQ(server.received(), "bye"); // Encrypted and sent before the close_notify
    ASSERT_FALSE(listener.callbackFired);
}

TEST(AddrInfo, ResolveOnTheLoop) {
    EventLoop loop;
    std::optional<IoResult<AddressInfo> > result;
    auto timerFired = false;
    auto pending = 2;
    auto done = [&]() {
        if (--pending == 0) {
            loop.stop();
        }
    };
    loop.callLater(1ms, [&]() {
        timerFired = true;
        done();
    });
    auto guard = loop.callLater(5s, [&]() {
        ADD_FAILURE() << "Timeout";
        loop.stop();
    });
    AddressInfo::fromHostname(loop, "127.0.0.1", "443", [&](IoResult<AddressInfo> res) {
        result = std::move(res);
        done();
    });
    ASSERT_FALSE(result); // Never reported inside the call
    loop.run();
    loop.cancelTimer(guard);

    ASSERT_TRUE(timerFired);
    ASSERT_TRUE(result);
    ASSERT_TRUE(*result) << (*result).error().message();
    auto endpoints = (*result)->endpoints();
    ASSERT_FALSE(endpoints.empty());
    ASSERT_EQ(endpoints[0].toString(), "127.0.0.1:443");
}

TEST(AddrInfo, ResolveFailureOnTheLoop) {
    EventLoop loop;
    std::optional<IoResult<AddressInfo> > result;
    AddressInfo::fromHostname(loop, "127.0.0.1", "https", [&](IoResult<AddressInfo> res) {
        result = std::move(res);
        loop.stop();
    });
    auto guard = loop.callLater(5s, [&]() {
        ADD_FAILURE() << "Timeout";
        loop.stop();
    });
    loop.run();
    loop.cancelTimer(guard);

    ASSERT_TRUE(result);
    ASSERT_FALSE(*result);
    ASSERT_STREQ((*result).error().category().name(), "getaddrinfo");
}

TEST(Tls, DestroyWhileResolving) {
    EventLoop loop;
    Recorder recorder(loop);
    TlsTransport transport(loop, std::make_shared<TlsContext>(TlsContext::NoDefaultRootCerts));
    transport.connect("127.0.0.1", 443, &recorder);

    // Runs right after the resolution started, the result arrives later and must be dropped
    loop.post([&]() { transport.destroy(); });
    loop.callLater(200ms, [&]() { loop.stop(); });
    loop.run();

    ASSERT_FALSE(recorder.connected);
    ASSERT_FALSE(recorder.closed);
    ASSERT_FALSE(recorder.error);
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
