/**
 * @file headers.hpp
 * @brief The ordered, case-insensitive HttpHeaders container
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/defines.hpp>
#include <initializer_list>
#include <algorithm>
#include <string_view>
#include <string>
#include <vector>

SPEECHWS_NS_BEGIN

namespace detail {

inline auto caseEqual(std::string_view a, std::string_view b) -> bool {
    return std::ranges::equal(a, b, [](char x, char y) {
        auto lower = [](char ch) { return (ch >= 'A' && ch <= 'Z') ? char(ch - 'A' + 'a') : ch; };
        return lower(x) == lower(y);
    });
}

} // namespace detail

/**
 * @brief Http Headers, keeps the insertion order because the handshake sends them as given
 *
 */
class HttpHeaders {
public:
    enum WellKnownHeader {
        UserAgent,
        Accept,
        AcceptEncoding,
        AcceptLanguage,
        CacheControl,
        Connection,
        Cookie,
        Date,
        Host,
        Origin,
        Pragma,
        Upgrade,
        SecWebSocketKey,
        SecWebSocketVersion,
        SecWebSocketAccept,
        ContentType,
        ContentLength,
    };

    using value_type = std::pair<std::string, std::string>;

    HttpHeaders() = default;
    HttpHeaders(HttpHeaders &&) = default;
    HttpHeaders(const HttpHeaders &) = default;
    ~HttpHeaders() = default;

    HttpHeaders(std::initializer_list<std::pair<std::string_view, std::string_view> > headers) {
        for (auto &[key, value] : headers) {
            append(key, value);
        }
    }

    auto contains(std::string_view key) const -> bool {
        return find(key) != mValues.end();
    }

    /**
     * @brief Get the first value of the key
     *
     * @param key
     * @return std::string_view (empty if not found)
     */
    auto value(std::string_view key) const -> std::string_view {
        auto iter = find(key);
        if (iter == mValues.end()) {
            return {};
        }
        return iter->second;
    }

    auto values(std::string_view key) const -> std::vector<std::string_view> {
        std::vector<std::string_view> ret;
        for (auto &[k, v] : mValues) {
            if (detail::caseEqual(k, key)) {
                ret.emplace_back(v);
            }
        }
        return ret;
    }

    auto append(std::string_view key, std::string_view value) -> void {
        mValues.emplace_back(std::string(key), std::string(value));
    }

    /**
     * @brief Replace all values of the key with one, appended at the end if not present
     *
     * @param key
     * @param value
     */
    auto set(std::string_view key, std::string_view value) -> void {
        auto iter = find(key);
        if (iter == mValues.end()) {
            append(key, value);
            return;
        }
        iter->second = value;
        auto first = iter + 1;
        mValues.erase(std::remove_if(first, mValues.end(), [&](const value_type &item) {
            return detail::caseEqual(item.first, key);
        }), mValues.end());
    }

    auto remove(std::string_view key) -> void {
        std::erase_if(mValues, [&](const value_type &item) {
            return detail::caseEqual(item.first, key);
        });
    }

    auto contains(WellKnownHeader header) const -> bool { return contains(stringOf(header)); }
    auto value(WellKnownHeader header) const -> std::string_view { return value(stringOf(header)); }
    auto values(WellKnownHeader header) const -> std::vector<std::string_view> { return values(stringOf(header)); }
    auto append(WellKnownHeader header, std::string_view value) -> void { append(stringOf(header), value); }
    auto set(WellKnownHeader header, std::string_view value) -> void { set(stringOf(header), value); }
    auto remove(WellKnownHeader header) -> void { remove(stringOf(header)); }

    auto begin() const { return mValues.begin(); }
    auto end() const { return mValues.end(); }
    auto size() const -> size_t { return mValues.size(); }
    auto empty() const -> bool { return mValues.empty(); }

    auto operator =(const HttpHeaders &other) -> HttpHeaders & = default;
    auto operator =(HttpHeaders &&other) -> HttpHeaders & = default;
    auto operator ==(const HttpHeaders &other) const -> bool = default;

    /**
     * @brief Parse the "Key: Value" lines of a header block, separated by CRLF (LF alone is tolerated)
     * @note Lines without a colon are skipped, values are trimmed
     *
     * @param block
     * @return HttpHeaders
     */
    static auto parse(std::string_view block) -> HttpHeaders {
        HttpHeaders headers;
        while (!block.empty()) {
            auto pos = block.find('\n');
            auto line = block.substr(0, pos);
            block = (pos == block.npos) ? std::string_view() : block.substr(pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            auto colon = line.find(':');
            if (colon == line.npos) {
                continue;
            }
            headers.append(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        }
        return headers;
    }

    static auto stringOf(WellKnownHeader header) -> std::string_view {
        using namespace std::literals;
        switch (header) {
            case UserAgent: return "User-Agent"sv;
            case Accept: return "Accept"sv;
            case AcceptEncoding: return "Accept-Encoding"sv;
            case AcceptLanguage: return "Accept-Language"sv;
            case CacheControl: return "Cache-Control"sv;
            case Connection: return "Connection"sv;
            case Cookie: return "Cookie"sv;
            case Date: return "Date"sv;
            case Host: return "Host"sv;
            case Origin: return "Origin"sv;
            case Pragma: return "Pragma"sv;
            case Upgrade: return "Upgrade"sv;
            case SecWebSocketKey: return "Sec-WebSocket-Key"sv;
            case SecWebSocketVersion: return "Sec-WebSocket-Version"sv;
            case SecWebSocketAccept: return "Sec-WebSocket-Accept"sv;
            case ContentType: return "Content-Type"sv;
            case ContentLength: return "Content-Length"sv;
            default: return ""sv;
        }
    }
private:
    auto find(std::string_view key) const -> std::vector<value_type>::const_iterator {
        return std::find_if(mValues.begin(), mValues.end(), [&](const value_type &item) {
            return detail::caseEqual(item.first, key);
        });
    }

    auto find(std::string_view key) -> std::vector<value_type>::iterator {
        return std::find_if(mValues.begin(), mValues.end(), [&](const value_type &item) {
            return detail::caseEqual(item.first, key);
        });
    }

    static auto trim(std::string_view sv) -> std::string_view {
        while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
        while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) sv.remove_suffix(1);
        return sv;
    }

    std::vector<value_type> mValues;
};

SPEECHWS_NS_END

// --- Formatter for HttpHeaders
SPEECHWS_FORMATTER(HttpHeaders::WellKnownHeader) {
    auto format(const auto &header, auto &ctxt) const {
        return format_to(ctxt.out(), "{}", SPEECHWS_NAMESPACE::HttpHeaders::stringOf(header));
    }
};

// Each header as one "Key: Value\r\n" line
SPEECHWS_FORMATTER(HttpHeaders) {
    auto format(const auto &headers, auto &ctxt) const {
        auto out = ctxt.out();
        for (auto &[key, value] : headers) {
            out = format_to(out, "{}: {}\r\n", key, value);
        }
        return out;
    }
};
