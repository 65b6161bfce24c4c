/**
 * @file timer.hpp
 * @brief The mini one-shot timer service, the event loop drives it by a timerfd
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <speechws/log.hpp>
#include <unordered_map>
#include <functional>
#include <optional>
#include <utility>
#include <chrono>
#include <map>

SPEECHWS_NS_BEGIN

namespace runtime {

class TimerService final {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Callback = std::function<void()>;
    using TimerId = uint64_t;

    TimerService() = default;
    TimerService(const TimerService &) = delete;
    ~TimerService() {
        if (!mTimers.empty()) {
            SPEECHWS_TRACE("Timer", "Drop {} pending timers", mTimers.size());
        }
    }

    /**
     * @brief Set the callback invoked when the earliest timepoint changed (nullopt on no timers)
     *
     * @param fn
     */
    auto setCallback(std::function<void(std::optional<TimePoint>)> fn) -> void {
        mNotify = std::move(fn);
    }

    /**
     * @brief Submit a callback to run at the timepoint
     *
     * @param timepoint
     * @param callback
     * @return TimerId (never 0)
     */
    auto submit(TimePoint timepoint, Callback callback) -> TimerId {
        auto id = ++mNextId;
        auto earliest = nextTimepoint();
        mTimers.emplace(Key {timepoint, id}, std::move(callback));
        mIndex.emplace(id, timepoint);
        SPEECHWS_TRACE("Timer", "Submit timer {} on {}", id, timepoint.time_since_epoch());
        if (!earliest || timepoint < *earliest) {
            notify();
        }
        return id;
    }

    /**
     * @brief Cancel a timer
     *
     * @param id
     * @return true if the timer was pending
     */
    auto cancel(TimerId id) -> bool {
        auto iter = mIndex.find(id);
        if (iter == mIndex.end()) {
            return false;
        }
        mTimers.erase(Key {iter->second, id});
        mIndex.erase(iter);
        SPEECHWS_TRACE("Timer", "Cancel timer {}", id);
        notify();
        return true;
    }

    /**
     * @brief Run all the expired timers, a callback may submit or cancel timers
     *
     */
    auto updateTimers() -> void {
        bool fired = false;
        while (!mTimers.empty()) {
            auto iter = mTimers.begin();
            if (iter->first.first > std::chrono::steady_clock::now()) {
                break;
            }
            auto callback = std::move(iter->second);
            mIndex.erase(iter->first.second);
            mTimers.erase(iter);
            fired = true;
            callback();
        }
        if (fired) {
            notify();
        }
    }

    /**
     * @brief Report the earliest timepoint again, used after the clock source fired
     *
     */
    auto refresh() -> void {
        notify();
    }

    auto nextTimepoint() const -> std::optional<TimePoint> {
        if (mTimers.empty()) {
            return std::nullopt;
        }
        return mTimers.begin()->first.first;
    }

    auto size() const -> size_t {
        return mTimers.size();
    }
private:
    using Key = std::pair<TimePoint, TimerId>; // Id breaks the tie, so timers on the same timepoint run in submit order

    auto notify() -> void {
        if (mNotify) {
            mNotify(nextTimepoint());
        }
    }

    std::map<Key, Callback> mTimers;
    std::unordered_map<TimerId, TimePoint> mIndex;
    std::function<void(std::optional<TimePoint>)> mNotify;
    TimerId mNextId = 0;
};

} // namespace runtime

SPEECHWS_NS_END
