/**
 * @file gec.hpp
 * @brief The Sec-MS-GEC token of the read-aloud service and its clock skew correction
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/io/error.hpp>
#include <string_view>
#include <optional>
#include <chrono>
#include <string>

SPEECHWS_NS_BEGIN

namespace auth {

using Clock = std::chrono::system_clock;

// The public client id of the read-aloud service
inline constexpr auto TrustedClientToken = std::string_view {"6A5AA1D4EAFF4E9FB37E23D68491D6F4"};

// Seconds between 1601-01-01 (windows file time) and 1970-01-01
inline constexpr int64_t WinEpochOffset = 11644473600;

// Tokens change every 5 minutes
inline constexpr int64_t WindowSeconds = 300;

// File time ticks are 100ns
inline constexpr int64_t TicksPerSecond = 10000000;

/**
 * @brief The correction between the local clock and the server clock
 *
 * @note Not thread safe, share one tracker per remote service on the loop thread
 */
class SPEECHWS_API SkewTracker {
public:
    SkewTracker() = default;
    explicit SkewTracker(std::chrono::milliseconds skew) : mSkew(skew) { }

    auto skew() const -> std::chrono::milliseconds { return mSkew; }
    auto setSkew(std::chrono::milliseconds skew) -> void { mSkew = skew; }

    /**
     * @brief Get the local time adjusted by the correction
     *
     * @param now The local time
     * @return Clock::time_point
     */
    auto correctedNow(Clock::time_point now = Clock::now()) const -> Clock::time_point;

    /**
     * @brief Fold the difference between the server date and the corrected local time into the correction
     *
     * @param serverDate The Date header of the server, in any of the HTTP date formats
     * @param now The local time
     * @return IoResult<void> (WsError::InvalidSkewDate, the correction is unchanged)
     */
    auto correct(std::string_view serverDate, Clock::time_point now = Clock::now()) -> IoResult<void>;
private:
    std::chrono::milliseconds mSkew {0};
};

/**
 * @brief Get the windows file time ticks of the 5 minutes window containing the time
 *
 * @param time
 * @return int64_t
 */
extern auto SPEECHWS_API windowTicks(Clock::time_point time) -> int64_t;

/**
 * @brief Generate the Sec-MS-GEC token, uppercase hex sha256 of the window ticks and the client token
 *
 * @param skew The correction to apply on the time
 * @param now The local time
 * @param trustedClientToken
 * @return std::string (64 chars)
 */
extern auto SPEECHWS_API generateSecMsGec(
    const SkewTracker &skew,
    Clock::time_point now = Clock::now(),
    std::string_view trustedClientToken = TrustedClientToken
) -> std::string;

/**
 * @brief Parse a HTTP date, IMF-fixdate, RFC 850 or asctime
 *
 * @param date
 * @return std::optional<Clock::time_point>
 */
extern auto SPEECHWS_API parseHttpDate(std::string_view date) -> std::optional<Clock::time_point>;

} // namespace auth

SPEECHWS_NS_END
