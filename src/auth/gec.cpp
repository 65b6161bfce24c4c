/**
 * @file gec.cpp
 * @brief The Sec-MS-GEC token
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#include <speechws/auth/gec.hpp>
#include <speechws/ws/error.hpp>
#include <speechws/crypt.hpp>
#include <speechws/log.hpp>
#include <array>
#include <cstdio>

SPEECHWS_NS_BEGIN

namespace auth {

using namespace std::chrono;

namespace {

constexpr std::array<std::string_view, 12> Months {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

auto monthOf(std::string_view name) -> unsigned {
    for (unsigned idx = 0; idx < Months.size(); ++idx) {
        if (Months[idx] == name) {
            return idx + 1;
        }
    }
    return 0;
}

auto makeTime(int y, std::string_view mon, int d, int h, int m, int s) -> std::optional<Clock::time_point> {
    auto date = year_month_day {year(y), month(monthOf(mon)), day(unsigned(d))};
    if (!date.ok() || h < 0 || h > 23 || m < 0 || m > 59 || s < 0 || s > 60) {
        return std::nullopt;
    }
    return sys_days(date) + hours(h) + minutes(m) + seconds(s);
}

} // namespace

auto SkewTracker::correctedNow(Clock::time_point now) const -> Clock::time_point {
    return now + mSkew;
}

auto SkewTracker::correct(std::string_view serverDate, Clock::time_point now) -> IoResult<void> {
    auto server = parseHttpDate(serverDate);
    if (!server) {
        SPEECHWS_WARN("Auth", "Can't parse the server date '{}'", serverDate);
        return Err(WsError::InvalidSkewDate);
    }
    auto diff = duration_cast<milliseconds>(*server - correctedNow(now));
    mSkew += diff;
    SPEECHWS_INFO("Auth", "Clock skew corrected by {}, now {}", diff, mSkew);
    return {};
}

auto windowTicks(Clock::time_point time) -> int64_t {
    auto ticks = floor<seconds>(time.time_since_epoch()).count() + WinEpochOffset;
    ticks -= ticks % WindowSeconds;
    return ticks * TicksPerSecond;
}

auto generateSecMsGec(const SkewTracker &skew, Clock::time_point now, std::string_view trustedClientToken) -> std::string {
    auto input = fmtlib::format("{}{}", windowTicks(skew.correctedNow(now)), trustedClientToken);
    return hex::encode(CryptoHash::hash(makeBuffer(input), CryptoHash::Sha256), hex::Upper);
}

auto parseHttpDate(std::string_view date) -> std::optional<Clock::time_point> {
    // sscanf needs the terminator
    auto str = std::string(date);
    char mon[4] {0};
    int y = 0, d = 0, h = 0, m = 0, s = 0;

    auto comma = str.find(',');
    if (comma == str.npos) {
        // asctime: Sun Nov  6 08:49:37 1994
        if (::sscanf(str.c_str(), "%*3s %3s %d %d:%d:%d %d", mon, &d, &h, &m, &s, &y) != 6) {
            return std::nullopt;
        }
        return makeTime(y, mon, d, h, m, s);
    }
    if (str.find('-', comma) != str.npos) {
        // RFC 850: Sunday, 06-Nov-94 08:49:37 GMT
        if (::sscanf(str.c_str() + comma + 1, " %d-%3s-%d %d:%d:%d", &d, mon, &y, &h, &m, &s) != 6) {
            return std::nullopt;
        }
        if (y < 100) {
            y += (y < 70) ? 2000 : 1900;
        }
        return makeTime(y, mon, d, h, m, s);
    }
    // IMF-fixdate: Sun, 06 Nov 1994 08:49:37 GMT
    if (::sscanf(str.c_str() + comma + 1, " %d %3s %d %d:%d:%d", &d, mon, &y, &h, &m, &s) != 6) {
        return std::nullopt;
    }
    return makeTime(y, mon, d, h, m, s);
}

} // namespace auth

SPEECHWS_NS_END
