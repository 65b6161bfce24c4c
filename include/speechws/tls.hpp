/**
 * @file tls.hpp
 * @brief The OpenSSL context and the TLS client transport over a non-blocking TCP socket
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <speechws/platform/epoll.hpp>
#include <speechws/net/transport.hpp>
#include <speechws/io/error.hpp>
#include <speechws/buffer.hpp>
#include <string_view>
#include <memory>

SPEECHWS_NS_BEGIN

/**
 * @brief The error category of the OpenSSL error queue codes
 *
 */
class SPEECHWS_API TlsCategory final : public std::error_category {
public:
    constexpr TlsCategory() noexcept {}

    auto name() const noexcept -> const char * override;
    auto message(int code) const -> std::string override;

    static auto instance() noexcept -> const TlsCategory &;
};

/**
 * @brief The shared TLS configuration (SSL_CTX)
 *
 */
class SPEECHWS_API TlsContext final {
public:
    enum Flags : uint32_t {
        None               = 0,
        NoVerify           = 1 << 10, // Tell the context to don't verify the peer certificate
        NoDefaultRootCerts = 1 << 11, // Tell the context to don't load the system CA when constructed
    };

    explicit TlsContext(uint32_t flags = None);
    TlsContext(const TlsContext &) = delete;
    TlsContext(TlsContext &&other) noexcept;
    ~TlsContext();

    auto setVerify(bool verify) -> void;
    auto verify() const -> bool { return mVerify; }

    // Roots certificates
    auto loadDefaultRootCerts() -> bool;
    auto loadRootCerts(Buffer pem) -> bool;
    auto loadRootCertsFile(std::string_view path) -> bool;

    ///> @brief Get the SSL_CTX
    auto native() const -> void * { return mCtxt; }
private:
    void *mCtxt = nullptr;
    bool  mVerify = true;
};

/**
 * @brief The TLS client transport, resolve + connect + handshake + encrypted duplex, driven by the event loop
 * @note Nothing blocks the loop, the name resolution runs off it and reports back through post()
 *
 */
class SPEECHWS_API TlsTransport final : public Transport {
public:
    TlsTransport(EventLoop &loop, std::shared_ptr<TlsContext> ctxt);
    TlsTransport(const TlsTransport &) = delete;
    ~TlsTransport();

    auto connect(std::string_view host, uint16_t port, TransportListener *listener) -> void override;
    auto write(ByteVector data, WriteCallback callback) -> void override;
    auto destroy() -> void override;

    class Impl;
private:
    std::shared_ptr<Impl> d;
};

SPEECHWS_NS_END
