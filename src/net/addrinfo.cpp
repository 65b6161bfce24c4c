#include <speechws/net/addrinfo.hpp>
#include <speechws/io/system_error.hpp>
#include <speechws/log.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <memory>
#include <thread>

SPEECHWS_NS_BEGIN

namespace {

// Owned by the pending resolution, released on the loop thread once the result is delivered
struct ResolveRequest {
    EventLoop            &loop;
    AddressInfo::Callback callback;
    std::string           name;
    std::string           service;
    ::addrinfo            hints {};
    IoResult<AddressInfo> result;
#if defined(__GLIBC__)
    ::gaicb               cb {};
    ::sigevent            event {};
#endif
};

auto makeHints() -> ::addrinfo {
    ::addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV; // The port is always a number here
    return hints;
}

auto toError(int err) -> std::error_code {
    if (err == EAI_SYSTEM) {
        return SystemError::fromErrno();
    }
    return GaiError(err);
}

// Hand the result back to the loop thread, the request is freed there
auto deliver(ResolveRequest *request) -> void {
    request->loop.post([request]() {
        auto owner = std::unique_ptr<ResolveRequest>(request);
        if (!owner->result) {
            SPEECHWS_WARN("AddrInfo", "Failed to resolve {}:{}: {}", owner->name, owner->service, owner->result.error().message());
        }
        owner->callback(std::move(owner->result));
    });
}

} // namespace

auto GaiCategory::name() const noexcept -> const char * {
    return "getaddrinfo";
}

auto GaiCategory::message(int code) const -> std::string {
    return ::gai_strerror(code);
}

auto GaiCategory::instance() noexcept -> const GaiCategory & {
    static constinit GaiCategory instance;
    return instance;
}

auto Endpoint::toString() const -> std::string {
    char buf[INET6_ADDRSTRLEN] {0};
    if (family == AF_INET) {
        auto in = reinterpret_cast<const ::sockaddr_in *>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
        return fmtlib::format("{}:{}", buf, ntohs(in->sin_port));
    }
    if (family == AF_INET6) {
        auto in6 = reinterpret_cast<const ::sockaddr_in6 *>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
        return fmtlib::format("[{}]:{}", buf, ntohs(in6->sin6_port));
    }
    return "<unknown>";
}

auto AddressInfo::endpoints() const -> std::vector<Endpoint> {
    std::vector<Endpoint> vec;
    for (auto cur = mInfo.get(); cur != nullptr; cur = cur->ai_next) {
        if (cur->ai_addrlen > sizeof(::sockaddr_storage)) {
            continue;
        }
        Endpoint ep;
        ep.family = cur->ai_family;
        ep.socktype = cur->ai_socktype;
        ep.protocol = cur->ai_protocol;
        ep.length = cur->ai_addrlen;
        ::memcpy(&ep.addr, cur->ai_addr, cur->ai_addrlen);
        vec.emplace_back(ep);
    }
    return vec;
}

auto AddressInfo::fromHostnameBlocking(std::string_view name, std::string_view service, int family) -> IoResult<AddressInfo> {
    auto hints = makeHints();
    hints.ai_family = family;

    std::string name_(name);
    std::string service_(service);
    ::addrinfo *info = nullptr;
    auto err = ::getaddrinfo(name_.c_str(), service_.c_str(), &hints, &info);
    if (err != 0) {
        auto ec = toError(err);
        SPEECHWS_WARN("AddrInfo", "Failed to resolve {}:{}: {}", name, service, ec.message());
        return Err(ec);
    }
    return AddressInfo(info);
}

auto AddressInfo::fromHostname(EventLoop &loop, std::string_view name, std::string_view service, Callback callback) -> void {
    auto request = std::unique_ptr<ResolveRequest>(new ResolveRequest {
        .loop = loop,
        .callback = std::move(callback),
        .name = std::string(name),
        .service = std::string(service),
        .hints = makeHints(),
    });
    SPEECHWS_TRACE("AddrInfo", "Resolving {}:{}", name, service);

#if defined(__GLIBC__) // glibc, use getaddrinfo_a
    request->cb.ar_name = request->name.c_str();
    request->cb.ar_service = request->service.c_str();
    request->cb.ar_request = &request->hints;
    request->event.sigev_notify = SIGEV_THREAD; // Notified on a glibc helper thread
    request->event.sigev_value.sival_ptr = request.get();
    request->event.sigev_notify_function = [](::sigval val) {
        auto request = static_cast<ResolveRequest *>(val.sival_ptr);
        if (auto err = ::gai_error(&request->cb); err != 0) {
            request->result = Err(toError(err));
        }
        else {
            request->result = AddressInfo(request->cb.ar_result);
        }
        deliver(request);
    };
    ::gaicb *list[] = { &request->cb };
    if (auto ret = ::getaddrinfo_a(GAI_NOWAIT, list, 1, &request->event); ret != 0) {
        request->result = Err(toError(ret));
        deliver(request.release());
        return;
    }
    request.release(); // Freed after the notification
#else
    // No native async resolver, run the blocking call on a worker thread
    std::thread([request = request.release()]() {
        request->result = fromHostnameBlocking(request->name, request->service);
        deliver(request);
    }).detach();
#endif

}

SPEECHWS_NS_END
