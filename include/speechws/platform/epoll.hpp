/**
 * @file epoll.hpp
 * @brief The single threaded, callback driven event loop on epoll
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <speechws/runtime/timer.hpp>
#include <speechws/io/error.hpp>
#include <unordered_map>
#include <functional>
#include <atomic>
#include <memory>
#include <chrono>
#include <thread> // std::thread::id
#include <mutex> // std::mutex
#include <deque> // std::deque
#include <span> // std::span

#include <sys/epoll.h> // epoll_event

SPEECHWS_NS_BEGIN

/**
 * @brief The event loop, everything except post() and stop() must be called on the loop thread
 *
 */
class SPEECHWS_API EpollContext final {
public:
    using Handler = std::function<void(uint32_t revents)>;
    using Callback = std::function<void()>;
    using TimerId = runtime::TimerService::TimerId;

    /**
     * @brief Construct a new Epoll Context object
     * @throws std::system_error if epoll, eventfd or timerfd can't be created
     */
    EpollContext();
    EpollContext(const EpollContext &) = delete;
    ~EpollContext();

    ///> @brief Watch the fd for the events (level triggered), the handler receives the epoll revents
    auto addDescriptor(fd_t fd, uint32_t events, Handler handler) -> IoResult<void>;
    ///> @brief Change the watched events of the fd
    auto modifyDescriptor(fd_t fd, uint32_t events) -> IoResult<void>;
    ///> @brief Stop watching the fd, the pending events of it in this round are dropped
    auto removeDescriptor(fd_t fd) -> IoResult<void>;

    ///> @brief Post a callable to run on the loop, can be called from any thread
    auto post(Callback callback) -> void;

    ///> @brief Run the callback once after the delay
    auto callLater(std::chrono::milliseconds delay, Callback callback) -> TimerId;
    ///> @brief Cancel a timer from callLater, return false if it already fired or was canceled
    auto cancelTimer(TimerId id) -> bool;

    ///> @brief Run the loop until stop() is called
    auto run() -> void;
    ///> @brief Make run() return after the current round, can be called from any thread
    auto stop() -> void;
private:
    struct Descriptor {
        fd_t     fd = -1;
        uint32_t generation = 0;
        Handler  handler;
    };

    auto processCallbacks() -> void;
    auto processEvents(std::span<const epoll_event> events) -> void;
    auto pollCallbacks() -> void;
    auto processTimer() -> void;
    auto wakeup() -> void;

    int                    mEpollFd = -1;
    int                    mEventFd = -1; // For wakeup the epoll, there is some new callback in the queue
    int                    mTimerFd = -1;
    runtime::TimerService  mService;
    std::unordered_map<fd_t, std::shared_ptr<Descriptor> > mDescriptors;
    uint32_t               mGeneration = 0; // Tagged into the epoll data, drop events of a removed fd reused in the same round
    std::deque<Callback>   mCallbacks; // The callbacks in current thread, non mutex
    std::deque<Callback>   mPendingCallbacks; // The callbacks from another thread, protected by mMutex
    std::mutex             mMutex;
    std::atomic<bool>      mStopped {false};
    std::thread::id        mThreadId { std::this_thread::get_id() };
};

using EventLoop = EpollContext;

SPEECHWS_NS_END
