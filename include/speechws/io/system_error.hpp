#pragma once

/**
 * @file system_error.hpp
 * @brief Wrapping the errno values reported by the kernel
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <speechws/io/error.hpp>
#include <system_error>
#include <cerrno>
#include <string>

SPEECHWS_NS_BEGIN

/**
 * @brief The system error category, compares equal to IoError and std::errc
 *
 */
class SPEECHWS_API SystemCategory final : public std::error_category {
public:
    constexpr SystemCategory() noexcept {}

    auto name() const noexcept -> const char* override;
    auto message(int value) const -> std::string override;
    auto equivalent(int value, const std::error_condition &other) const noexcept -> bool override;
    auto default_error_condition(int value) const noexcept -> std::error_condition override;

    static auto instance() noexcept -> const SystemCategory &;
};

/**
 * @brief System Error class, wrapping errno
 *
 */
class SPEECHWS_API SystemError {
public:
    enum Code : error_t {
        Ok                            = 0,
        AccessDenied                  = EACCES,
        AddressInUse                  = EADDRINUSE,
        AddressNotAvailable           = EADDRNOTAVAIL,
        AddressFamilyNotSupported     = EAFNOSUPPORT,
        AlreadyInProgress             = EALREADY,
        BadFileDescriptor             = EBADF,
        ConnectionAborted             = ECONNABORTED,
        ConnectionRefused             = ECONNREFUSED,
        ConnectionReset               = ECONNRESET,
        DestinationAddressRequired    = EDESTADDRREQ,
        BadAddress                    = EFAULT,
        HostDown                      = EHOSTDOWN,
        HostUnreachable               = EHOSTUNREACH,
        InProgress                    = EINPROGRESS,
        InvalidArgument               = EINVAL,
        SocketIsConnected             = EISCONN,
        TooManyOpenFiles              = EMFILE,
        MessageTooLarge               = EMSGSIZE,
        NetworkDown                   = ENETDOWN,
        NetworkReset                  = ENETRESET,
        NetworkUnreachable            = ENETUNREACH,
        NoBufferSpaceAvailable        = ENOBUFS,
        ProtocolOptionNotSupported    = ENOPROTOOPT,
        SocketIsNotConnected          = ENOTCONN,
        NotASocket                    = ENOTSOCK,
        OperationNotSupported         = EOPNOTSUPP,
        ProtocolFamilyNotSupported    = EPFNOSUPPORT,
        ProtocolNotSupported          = EPROTONOSUPPORT,
        SocketShutdown                = ESHUTDOWN,
        SocketTypeNotSupported        = ESOCKTNOSUPPORT,
        TimedOut                      = ETIMEDOUT,
        WouldBlock                    = EWOULDBLOCK,
        Canceled                      = ECANCELED,
    };

    explicit SystemError(error_t err) : mErr(err) { }
    SystemError(Code err) : mErr(err) { }
    SystemError() = default;

    auto isOk() const noexcept -> bool { return mErr == 0; }

    /**
     * @brief Convert to string, by strerror
     *
     * @return std::string
     */
    auto toString() const -> std::string;

    /**
     * @brief Convert to the portable IoError
     *
     * @return IoError
     */
    auto toIoError() const -> IoError;

    auto operator <=>(const SystemError &other) const noexcept = default;

    explicit operator int() const { return mErr; }

    /**
     * @brief Get the system error from the errno
     *
     * @return SystemError
     */
    static auto fromErrno() -> SystemError { return SystemError(errno); }
private:
    error_t mErr = 0;
};

SPEECHWS_DECLARE_ERROR(SystemError, SystemCategory);
SPEECHWS_DECLARE_ERROR(SystemError::Code, SystemCategory);

SPEECHWS_NS_END
