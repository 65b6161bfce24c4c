#include <speechws/io/system_error.hpp>
#include <speechws/io/error.hpp>
#include <string.h>
#include <string_view>
#include <utility>
#include <array>
#include <tuple>

SPEECHWS_NS_BEGIN

namespace reflect {

// Get the name of the enumerator in compile time
template <auto T>
consteval auto nameof() {
    std::string_view name(__PRETTY_FUNCTION__);
    size_t begin = name.find_last_of(':');
    if (begin == std::string_view::npos) {
        begin = name.find_last_of(' ');
    }
    size_t end = name.find_last_of(']');
    return name.substr(begin + 1, end - begin - 1);
}

// Copy the name into an array, so it can outlive the consteval context
template <auto T>
consteval auto nameof2() {
    constexpr auto name = nameof<T>();
    std::array<char, name.size()> buffer {0};
    for (size_t i = 0; i < name.size(); ++i) {
        buffer[i] = name[i];
    }
    return buffer;
}

template <size_t ...N, typename T>
auto enum2str(std::index_sequence<N...>, T i) -> std::string_view {
    constexpr static auto data = std::tuple {
        reflect::nameof2<T(N)>()...
    };
    constexpr std::array<std::string_view, sizeof...(N)> table {
        std::string_view(
            std::get<N>(data).data(),
            std::get<N>(data).size()
        )...
    };
    auto idx = static_cast<int64_t>(i);
    if (idx < 0 || idx >= int64_t(table.size())) {
        return "Other";
    }
    return table[idx];
}

} // namespace reflect

#pragma region IoError
auto IoCategory::message(int err) const -> std::string {
    return IoError(err).toString();
}

auto IoCategory::name() const noexcept -> const char * {
    return "io";
}

auto IoCategory::instance() noexcept -> const IoCategory & {
    static constinit IoCategory instance;
    return instance;
}

auto IoCategory::equivalent(int value, const std::error_condition &other) const noexcept -> bool {
    if (other.category() == instance()) {
        return value == other.value();
    }
    if (other.category() == std::generic_category()) { // Compare with std::errc
        return IoError(value).toStd() == std::errc(other.value());
    }
    return false;
}

auto IoError::toString() const -> std::string {
    auto view = reflect::enum2str(std::make_index_sequence<IoError::Other>(), mErr);
    return std::string(view);
}

auto IoError::toStd() const -> std::errc {
    switch (mErr) {
        case IoError::Ok                        : return std::errc();
        case IoError::AccessDenied              : return std::errc::permission_denied;
        case IoError::AddressInUse              : return std::errc::address_in_use;
        case IoError::AddressNotAvailable       : return std::errc::address_not_available;
        case IoError::AddressFamilyNotSupported : return std::errc::address_family_not_supported;
        case IoError::AlreadyInProgress         : return std::errc::operation_in_progress;
        case IoError::BadFileDescriptor         : return std::errc::bad_file_descriptor;
        case IoError::ConnectionAborted         : return std::errc::connection_aborted;
        case IoError::ConnectionRefused         : return std::errc::connection_refused;
        case IoError::ConnectionReset           : return std::errc::connection_reset;
        case IoError::DestinationAddressRequired: return std::errc::destination_address_required;
        case IoError::BadAddress                : return std::errc::bad_address;
        case IoError::HostDown                  : return std::errc::host_unreachable;
        case IoError::HostUnreachable           : return std::errc::host_unreachable;
        case IoError::InProgress                : return std::errc::operation_in_progress;
        case IoError::InvalidArgument           : return std::errc::invalid_argument;
        case IoError::SocketIsConnected         : return std::errc::already_connected;
        case IoError::TooManyOpenFiles          : return std::errc::too_many_files_open;
        case IoError::MessageTooLarge           : return std::errc::message_size;
        case IoError::NetworkDown               : return std::errc::network_down;
        case IoError::NetworkReset              : return std::errc::network_reset;
        case IoError::NetworkUnreachable        : return std::errc::network_unreachable;
        case IoError::NoBufferSpaceAvailable    : return std::errc::no_buffer_space;
        case IoError::ProtocolOptionNotSupported: return std::errc::no_protocol_option;
        case IoError::SocketIsNotConnected      : return std::errc::not_connected;
        case IoError::NotASocket                : return std::errc::not_a_socket;
        case IoError::OperationNotSupported     : return std::errc::operation_not_supported;
        case IoError::ProtocolNotSupported      : return std::errc::protocol_not_supported;
        case IoError::TimedOut                  : return std::errc::timed_out;
        case IoError::WouldBlock                : return std::errc::operation_would_block;
        case IoError::Canceled                  : return std::errc::operation_canceled;
        default                                 : return std::errc::io_error;
    }
}

#pragma region SystemError
auto SystemCategory::message(int err) const -> std::string {
    return SystemError(err).toString();
}

auto SystemCategory::name() const noexcept -> const char * {
    return "os";
}

auto SystemCategory::default_error_condition(int err) const noexcept -> std::error_condition {
    return SystemError(err).toIoError().toStd();
}

auto SystemCategory::equivalent(int value, const std::error_condition &other) const noexcept -> bool {
    if (other.category() == instance()) {
        return value == other.value();
    }
    if (other.category() == IoCategory::instance()) {
        return SystemError(value).toIoError() == IoError(other.value());
    }
    if (other.category() == std::generic_category()) {
        return SystemError(value).toIoError().toStd() == std::errc(other.value());
    }
    return false;
}

auto SystemCategory::instance() noexcept -> const SystemCategory & {
    static constinit SystemCategory instance;
    return instance;
}

auto SystemError::toString() const -> std::string {
    char buf[256] {0};
    // GNU strerror_r may return a static string instead of filling buf
    const char *msg = ::strerror_r(mErr, buf, sizeof(buf));
    return msg;
}

auto SystemError::toIoError() const -> IoError {
    switch (mErr) {
        case SystemError::Ok                        : return IoError::Ok;
        case SystemError::AccessDenied              : return IoError::AccessDenied;
        case SystemError::AddressInUse              : return IoError::AddressInUse;
        case SystemError::AddressNotAvailable       : return IoError::AddressNotAvailable;
        case SystemError::AddressFamilyNotSupported : return IoError::AddressFamilyNotSupported;
        case SystemError::AlreadyInProgress         : return IoError::AlreadyInProgress;
        case SystemError::BadFileDescriptor         : return IoError::BadFileDescriptor;
        case SystemError::ConnectionAborted         : return IoError::ConnectionAborted;
        case SystemError::ConnectionRefused         : return IoError::ConnectionRefused;
        case SystemError::ConnectionReset           : return IoError::ConnectionReset;
        case SystemError::DestinationAddressRequired: return IoError::DestinationAddressRequired;
        case SystemError::BadAddress                : return IoError::BadAddress;
        case SystemError::HostDown                  : return IoError::HostDown;
        case SystemError::HostUnreachable           : return IoError::HostUnreachable;
        case SystemError::InProgress                : return IoError::InProgress;
        case SystemError::InvalidArgument           : return IoError::InvalidArgument;
        case SystemError::SocketIsConnected         : return IoError::SocketIsConnected;
        case SystemError::TooManyOpenFiles          : return IoError::TooManyOpenFiles;
        case SystemError::MessageTooLarge           : return IoError::MessageTooLarge;
        case SystemError::NetworkDown               : return IoError::NetworkDown;
        case SystemError::NetworkReset              : return IoError::NetworkReset;
        case SystemError::NetworkUnreachable        : return IoError::NetworkUnreachable;
        case SystemError::NoBufferSpaceAvailable    : return IoError::NoBufferSpaceAvailable;
        case SystemError::ProtocolOptionNotSupported: return IoError::ProtocolOptionNotSupported;
        case SystemError::SocketIsNotConnected      : return IoError::SocketIsNotConnected;
        case SystemError::NotASocket                : return IoError::NotASocket;
        case SystemError::OperationNotSupported     : return IoError::OperationNotSupported;
        case SystemError::ProtocolFamilyNotSupported: return IoError::ProtocolFamilyNotSupported;
        case SystemError::ProtocolNotSupported      : return IoError::ProtocolNotSupported;
        case SystemError::SocketShutdown            : return IoError::SocketShutdown;
        case SystemError::SocketTypeNotSupported    : return IoError::SocketTypeNotSupported;
        case SystemError::TimedOut                  : return IoError::TimedOut;
        case SystemError::WouldBlock                : return IoError::WouldBlock;
        case SystemError::Canceled                  : return IoError::Canceled;
        default                                     : return IoError::Other;
    }
}

SPEECHWS_NS_END
