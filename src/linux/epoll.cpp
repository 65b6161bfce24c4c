#include <speechws/platform/epoll.hpp>
#include <speechws/io/system_error.hpp>
#include <speechws/log.hpp>

#include <sys/timerfd.h>
#include <sys/eventfd.h>
#include <sys/epoll.h>
#include <unistd.h>
#include <array>

SPEECHWS_NS_BEGIN

namespace {
    constexpr uint64_t KindEventFd = 1;
    constexpr uint64_t KindTimerFd = 2;

    // The low 32 bits keep the fd, the high 32 bits keep the generation (never 0 for user descriptors)
    auto packData(fd_t fd, uint32_t generation) -> uint64_t {
        return (uint64_t(generation) << 32) | uint32_t(fd);
    }

    [[maybe_unused]]
    auto epollToString(uint32_t events) -> std::string {
        std::string ret;
        auto add = [&](uint32_t flag, std::string_view name) {
            if (events & flag) {
                ret += ret.empty() ? "" : " | ";
                ret += name;
            }
        };
        add(EPOLLIN, "EPOLLIN");
        add(EPOLLOUT, "EPOLLOUT");
        add(EPOLLRDHUP, "EPOLLRDHUP");
        add(EPOLLERR, "EPOLLERR");
        add(EPOLLHUP, "EPOLLHUP");
        if (ret.empty()) {
            ret = "None";
        }
        return ret;
    }
}

EpollContext::EpollContext() {
    mEpollFd = ::epoll_create1(EPOLL_CLOEXEC);
    if (mEpollFd == -1) {
        SPEECHWS_ERROR("Epoll", "Failed to create epoll file descriptor");
        throw std::system_error(SystemError::fromErrno(), "epoll_create1");
    }
    mEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (mEventFd == -1) {
        auto err = SystemError::fromErrno();
        SPEECHWS_ERROR("Epoll", "Failed to create eventfd file descriptor");
        ::close(mEpollFd);
        throw std::system_error(err, "eventfd");
    }
    mTimerFd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (mTimerFd == -1) {
        auto err = SystemError::fromErrno();
        SPEECHWS_ERROR("Epoll", "Failed to create timerfd file descriptor");
        ::close(mEpollFd);
        ::close(mEventFd);
        throw std::system_error(err, "timerfd_create");
    }
    auto bind = [this](int fd, uint64_t kind, const char *what) {
        ::epoll_event event {};
        event.events = EPOLLIN;
        event.data.u64 = kind;
        if (::epoll_ctl(mEpollFd, EPOLL_CTL_ADD, fd, &event) == -1) {
            auto err = SystemError::fromErrno();
            SPEECHWS_ERROR("Epoll", "Failed to add {} to epoll", what);
            ::close(mEpollFd);
            ::close(mEventFd);
            ::close(mTimerFd);
            throw std::system_error(err, "epoll_ctl");
        }
    };
    bind(mEventFd, KindEventFd, "eventfd");
    bind(mTimerFd, KindTimerFd, "timerfd");

    // Re-arm the timerfd on the earliest timer
    mService.setCallback([this](std::optional<runtime::TimerService::TimePoint> timepoint) {
        ::itimerspec timerval {};
        if (timepoint) { // Otherwise disarm it
            auto now = std::chrono::steady_clock::now();
            auto diff = std::chrono::duration_cast<std::chrono::nanoseconds>(*timepoint - now);
            if (diff.count() <= 0) {
                diff = std::chrono::nanoseconds(1);
            }
            timerval.it_value.tv_sec  = diff.count() / 1000000000;
            timerval.it_value.tv_nsec = diff.count() % 1000000000;
        }
        if (::timerfd_settime(mTimerFd, 0, &timerval, nullptr) == -1) {
            SPEECHWS_WARN("Epoll", "Failed to set timerfd time: {}", SystemError::fromErrno());
        }
    });
}

EpollContext::~EpollContext() {
    mService.setCallback(nullptr);
    ::close(mEpollFd);
    ::close(mEventFd);
    ::close(mTimerFd);
}

auto EpollContext::addDescriptor(fd_t fd, uint32_t events, Handler handler) -> IoResult<void> {
    if (fd < 0 || !handler) {
        SPEECHWS_WARN("Epoll", "Invalid file descriptor {}", fd);
        return Err(IoError::InvalidArgument);
    }
    if (mDescriptors.contains(fd)) {
        SPEECHWS_WARN("Epoll", "File descriptor {} is already added", fd);
        return Err(IoError::InvalidArgument);
    }
    if (++mGeneration == 0) { // Skip 0 on wrapping
        ++mGeneration;
    }
    auto desc = std::make_shared<Descriptor>();
    desc->fd = fd;
    desc->generation = mGeneration;
    desc->handler = std::move(handler);

    ::epoll_event event {};
    event.events = events;
    event.data.u64 = packData(fd, desc->generation);
    if (::epoll_ctl(mEpollFd, EPOLL_CTL_ADD, fd, &event) == -1) {
        auto err = SystemError::fromErrno();
        SPEECHWS_ERROR("Epoll", "Failed to add fd {} to epoll: {}", fd, err);
        return Err(err);
    }
    SPEECHWS_TRACE("Epoll", "Add fd {}, events: {}", fd, epollToString(events));
    mDescriptors.emplace(fd, std::move(desc));
    return {};
}

auto EpollContext::modifyDescriptor(fd_t fd, uint32_t events) -> IoResult<void> {
    auto iter = mDescriptors.find(fd);
    if (iter == mDescriptors.end()) {
        return Err(IoError::BadFileDescriptor);
    }
    ::epoll_event event {};
    event.events = events;
    event.data.u64 = packData(fd, iter->second->generation);
    if (::epoll_ctl(mEpollFd, EPOLL_CTL_MOD, fd, &event) == -1) {
        auto err = SystemError::fromErrno();
        SPEECHWS_WARN("Epoll", "Failed to modify fd {} epoll mode: {}", fd, err);
        return Err(err);
    }
    SPEECHWS_TRACE("Epoll", "Modify fd {}, events: {}", fd, epollToString(events));
    return {};
}

auto EpollContext::removeDescriptor(fd_t fd) -> IoResult<void> {
    auto iter = mDescriptors.find(fd);
    if (iter == mDescriptors.end()) {
        return Err(IoError::BadFileDescriptor);
    }
    mDescriptors.erase(iter);
    if (::epoll_ctl(mEpollFd, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        auto err = SystemError::fromErrno();
        SPEECHWS_WARN("Epoll", "Failed to remove fd {} from epoll: {}", fd, err);
        return Err(err);
    }
    SPEECHWS_TRACE("Epoll", "Remove fd {}", fd);
    return {};
}

auto EpollContext::post(Callback callback) -> void {
    SPEECHWS_ASSERT(callback);
    if (std::this_thread::get_id() == mThreadId) { // Same thread, just push to the queue
        mCallbacks.emplace_back(std::move(callback));
        return;
    }
    {
        std::lock_guard locker {mMutex};
        mPendingCallbacks.emplace_back(std::move(callback));
    }
    wakeup();
}

auto EpollContext::callLater(std::chrono::milliseconds delay, Callback callback) -> TimerId {
    return mService.submit(std::chrono::steady_clock::now() + delay, std::move(callback));
}

auto EpollContext::cancelTimer(TimerId id) -> bool {
    return mService.cancel(id);
}

auto EpollContext::stop() -> void {
    mStopped = true;
    if (std::this_thread::get_id() != mThreadId) {
        wakeup();
    }
}

auto EpollContext::run() -> void {
    mThreadId = std::this_thread::get_id();
    mStopped = false;
    while (!mStopped) {
        mService.updateTimers();
        processCallbacks();
        if (mStopped) {
            break;
        }
        std::array<epoll_event, 64> events;
        int timeout = mCallbacks.empty() ? -1 : 0; // Wait until we got any events (callbacks, io, timer)
        auto res = ::epoll_wait(mEpollFd, events.data(), int(events.size()), timeout);
        if (res > 0) {
            processEvents(std::span(events).subspan(0, res));
        }
        else if (res == -1 && errno != EINTR) {
            SPEECHWS_ERROR("Epoll", "epoll_wait failed: {}", SystemError::fromErrno());
            break;
        }
    }
}

auto EpollContext::wakeup() -> void {
    uint64_t data = 1;
    if (::write(mEventFd, &data, sizeof(data)) != sizeof(data)) {
        SPEECHWS_WARN("Epoll", "Failed to write to event fd: {}", SystemError::fromErrno());
    }
}

auto EpollContext::processCallbacks() -> void {
    // Only drain what is queued now, callbacks posted by them run in the next round
    auto count = mCallbacks.size();
    while (count-- > 0 && !mCallbacks.empty()) {
        auto cb = std::move(mCallbacks.front());
        mCallbacks.pop_front();
        cb();
    }
}

auto EpollContext::pollCallbacks() -> void {
    uint64_t data = 0; // Reset wakeup flag
    if (::read(mEventFd, &data, sizeof(data)) != sizeof(data) && errno != EAGAIN) {
        SPEECHWS_WARN("Epoll", "Failed to read from event fd: {}", SystemError::fromErrno());
    }
    std::lock_guard locker {mMutex};
    SPEECHWS_TRACE("Epoll", "Polling {} callbacks from different thread queue", mPendingCallbacks.size());
    for (auto &cb : mPendingCallbacks) {
        mCallbacks.emplace_back(std::move(cb));
    }
    mPendingCallbacks.clear();
}

auto EpollContext::processTimer() -> void {
    uint64_t expiredCount = 0;
    while (::read(mTimerFd, &expiredCount, sizeof(expiredCount)) == sizeof(uint64_t)) { }
    mService.updateTimers();
    mService.refresh(); // The timerfd is one shot, re-arm it for the rest
}

auto EpollContext::processEvents(std::span<const epoll_event> eventsArray) -> void {
    for (const auto &item : eventsArray) {
        auto data = item.data.u64;
        if (data == KindEventFd) {
            pollCallbacks();
            continue;
        }
        if (data == KindTimerFd) {
            processTimer();
            continue;
        }
        auto fd = fd_t(uint32_t(data & 0xffffffff));
        auto generation = uint32_t(data >> 32);
        auto iter = mDescriptors.find(fd);
        if (iter == mDescriptors.end() || iter->second->generation != generation) { // Removed by a previous handler
            continue;
        }
        auto desc = iter->second; // Keep the handler alive, it may remove itself
        SPEECHWS_TRACE("Epoll", "Got epoll event for fd: {}, events: {}", fd, epollToString(item.events));
        desc->handler(item.events);
    }
}

SPEECHWS_NS_END
