/**
 * @file addrinfo.hpp
 * @brief For wrapping getaddrinfo
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <speechws/platform/epoll.hpp>
#include <speechws/io/error.hpp> // for IoResult
#include <sys/socket.h>
#include <netdb.h>
#include <string_view>
#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <vector>

SPEECHWS_NS_BEGIN

/**
 * @brief The raw error code of getaddrinfo
 *
 */
enum class GaiError : int {
    TryAgain                  = EAI_AGAIN,
    Fail                      = EAI_FAIL,
    OutOfMemory               = EAI_MEMORY,
    NotFound                  = EAI_NONAME,
    AddressFamilyNotSupported = EAI_FAMILY,
    ServiceNotSupported       = EAI_SERVICE,
};

class SPEECHWS_API GaiCategory final : public std::error_category {
public:
    constexpr GaiCategory() noexcept {}

    auto name() const noexcept -> const char* override;
    auto message(int value) const -> std::string override;

    static auto instance() noexcept -> const GaiCategory &;
};

SPEECHWS_DECLARE_ERROR(GaiError, GaiCategory);

/**
 * @brief One resolved socket address, ready for socket() and connect()
 *
 */
struct Endpoint {
    int family = AF_UNSPEC;
    int socktype = SOCK_STREAM;
    int protocol = 0;
    ::sockaddr_storage addr {};
    ::socklen_t length = 0;

    auto data() const -> const ::sockaddr * {
        return reinterpret_cast<const ::sockaddr *>(&addr);
    }

    /**
     * @brief Format as "ip:port" or "[ip]:port"
     *
     * @return std::string
     */
    auto toString() const -> std::string;
};

/**
 * @brief Wrapper for addrinfo
 *
 */
class SPEECHWS_API AddressInfo {
public:
    explicit AddressInfo(::addrinfo *info) noexcept : mInfo(info) { }
    AddressInfo() = default;
    AddressInfo(const AddressInfo &) = delete;
    AddressInfo(AddressInfo &&info) = default;

    auto operator =(AddressInfo &&info) -> AddressInfo & = default;

    /**
     * @brief Get all endpoint from the info, in the resolver order
     *
     * @return std::vector<Endpoint>
     */
    auto endpoints() const -> std::vector<Endpoint>;

    auto get() const -> ::addrinfo * { return mInfo.get(); }

    explicit operator bool() const noexcept { return mInfo != nullptr; }

    /**
     * @brief Wrapping the raw getaddrinfo for a stream socket, blocking the caller
     *
     * @param name The hostname string
     * @param service The port number
     * @param family
     * @return IoResult<AddressInfo>
     */
    static auto fromHostnameBlocking(std::string_view name, std::string_view service, int family = AF_UNSPEC) -> IoResult<AddressInfo>;

    using Callback = std::function<void(IoResult<AddressInfo>)>;

    /**
     * @brief Resolve without blocking the loop (getaddrinfo_a on glibc, a worker thread elsewhere)
     *
     * @param loop The callback is posted to it, it must outlive the resolution
     * @param name The hostname string
     * @param service The port number
     * @param callback Called on the loop thread, never inside this call
     */
    static auto fromHostname(EventLoop &loop, std::string_view name, std::string_view service, Callback callback) -> void;
private:
    struct FreeInfo {
        auto operator ()(::addrinfo *info) const noexcept -> void {
            ::freeaddrinfo(info);
        }
    };
    std::unique_ptr<::addrinfo, FreeInfo> mInfo;
};

SPEECHWS_NS_END
