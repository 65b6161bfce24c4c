#pragma once

/**
 * @file url.hpp
 * @brief Wrapper of url string like wss://host:port/path?query, interface like QUrl
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include <speechws/defines.hpp>
#include <string_view>
#include <charconv>
#include <optional>
#include <string>
#include <bit>

SPEECHWS_NS_BEGIN

class Url {
public:
    /**
     * @brief Construct a new Url object
     *
     * @param str The url string (it should be encoded)
     */
    Url(std::string_view str);
    Url(const char *str) : Url(std::string_view(str)) { }
    Url(const Url &) = default;
    Url() = default;

    /**
     * @brief Check the url is empty
     *
     * @return true
     * @return false
     */
    auto empty() const -> bool;

    /**
     * @brief Check scheme and host are present and contain only safe chars
     *
     * @return true
     * @return false
     */
    auto isValid() const -> bool;

    auto scheme() const -> std::string_view { return mScheme; }
    auto host() const -> std::string_view { return mHost; }
    auto query() const -> std::string_view { return mQuery; }

    /**
     * @brief Get the path of the url, "/" if not set
     *
     * @return std::string_view
     */
    auto path() const -> std::string_view;

    /**
     * @brief Get the port of the url
     *
     * @return std::optional<uint16_t> (nullopt if not set)
     */
    auto port() const -> std::optional<uint16_t> { return mPort; }

    /**
     * @brief Get the port, or the well-known port of the scheme (443 for wss / https, 80 for ws / http)
     *
     * @return std::optional<uint16_t> (nullopt if unknown scheme without port)
     */
    auto effectivePort() const -> std::optional<uint16_t>;

    /**
     * @brief Get the request target used in a request line, path + "?" + query
     *
     * @return std::string
     */
    auto target() const -> std::string;

    /**
     * @brief Make the url to the string (encoded)
     *
     * @return std::string
     */
    auto toString() const -> std::string;

    auto setHost(std::string_view host) -> void { mHost = host; }

    /**
     * @brief Append a key=value pair to the query, the value will be encoded
     *
     * @param key Must be url safe
     * @param value
     */
    auto addQueryItem(std::string_view key, std::string_view value) -> void;

    auto operator =(const Url &) -> Url & = default;
    auto operator =(Url &&) -> Url & = default;
    auto operator <=>(const Url &other) const noexcept = default;

    /**
     * @brief Encode the string to url-encoded(percent encoding) string.
     * @note char not in 'a' - 'z' and 'A' - 'Z' and '0' - '9' and '-' and '.' and '_' and '~' will be encoded.
     *
     * @param str
     * @return std::string
     */
    static auto encodeComponent(std::string_view str) -> std::string;

    /**
     * @brief Decode the url-encoded (percent encoding) string to original string.
     *
     * @param str
     * @return std::string (empty on malformed escapes)
     */
    static auto decodeComponent(std::string_view str) -> std::string;

    ///> @brief Check every char is unreserved
    static auto isSafeString(std::string_view) -> bool;
private:
    static auto isSafeChar(char) -> bool;

    std::string mScheme;
    std::string mHost;
    std::optional<uint16_t> mPort;
    std::string mPath;
    std::string mQuery;
};

inline Url::Url(std::string_view sv) {
    if (auto pos = sv.find("://"); pos != sv.npos) {
        mScheme = sv.substr(0, pos);
        sv = sv.substr(pos + 3);
    }
    if (auto pos = sv.find('#'); pos != sv.npos) { // Fragment is never sent
        sv = sv.substr(0, pos);
    }
    if (auto pos = sv.find('?'); pos != sv.npos) {
        mQuery = sv.substr(pos + 1);
        sv = sv.substr(0, pos);
    }
    auto authority = sv;
    if (auto pos = sv.find('/'); pos != sv.npos) {
        authority = sv.substr(0, pos);
        mPath = sv.substr(pos);
    }
    if (auto pos = authority.rfind(':'); pos != authority.npos) {
        auto port = authority.substr(pos + 1);
        uint16_t result = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), result);
        if (ec == std::errc() && ptr == port.data() + port.size()) {
            mPort = result;
        }
        authority = authority.substr(0, pos);
    }
    mHost = authority;
}

inline auto Url::empty() const -> bool {
    return mScheme.empty() && mHost.empty() && mPath.empty() && mQuery.empty();
}

inline auto Url::isValid() const -> bool {
    return !mScheme.empty() && !mHost.empty() && isSafeString(mScheme) && isSafeString(mHost);
}

inline auto Url::path() const -> std::string_view {
    if (mPath.empty()) {
        return "/";
    }
    return mPath;
}

inline auto Url::effectivePort() const -> std::optional<uint16_t> {
    if (mPort) {
        return mPort;
    }
    if (mScheme == "wss" || mScheme == "https") {
        return 443;
    }
    if (mScheme == "ws" || mScheme == "http") {
        return 80;
    }
    return std::nullopt;
}

inline auto Url::target() const -> std::string {
    std::string output(path());
    if (!mQuery.empty()) {
        output += "?";
        output += mQuery;
    }
    return output;
}

inline auto Url::addQueryItem(std::string_view key, std::string_view value) -> void {
    if (!mQuery.empty()) {
        mQuery += "&";
    }
    mQuery += key;
    mQuery += "=";
    mQuery += encodeComponent(value);
}

inline auto Url::toString() const -> std::string {
    std::string output;
    if (!mScheme.empty()) {
        output += mScheme;
        output += "://";
    }
    output += mHost;
    if (mPort) {
        output += ":" + std::to_string(mPort.value());
    }
    output += mPath;
    if (!mQuery.empty()) {
        output += "?" + mQuery;
    }
    return output;
}

inline auto Url::isSafeChar(char ch) -> bool {
    return (ch >= '0' && ch <= '9') ||
        (ch >= 'a' && ch <= 'z') ||
        (ch >= 'A' && ch <= 'Z') ||
        ch == '-' ||
        ch == '_' ||
        ch == '.' ||
        ch == '~'
    ;
}

inline auto Url::isSafeString(std::string_view str) -> bool {
    for (auto ch : str) {
        if (!isSafeChar(ch)) {
            return false;
        }
    }
    return true;
}

inline auto Url::encodeComponent(std::string_view str) -> std::string {
    constexpr std::string_view digits = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size());
    for (auto ch : str) {
        if (isSafeChar(ch)) {
            out.push_back(ch);
            continue;
        }
        auto byte = std::bit_cast<uint8_t>(ch); //< For unicode, so cast to u8
        out.push_back('%');
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0f]);
    }
    return out;
}

inline auto Url::decodeComponent(std::string_view str) -> std::string {
    std::string out;
    out.reserve(str.size());
    for (size_t idx = 0; idx < str.size(); ) {
        if (str[idx] != '%') {
            out.push_back(str[idx]);
            ++idx;
            continue;
        }
        if (idx + 3 > str.size()) {
            return {};
        }
        uint8_t ch = 0;
        auto first = str.data() + idx + 1;
        auto [ptr, ec] = std::from_chars(first, first + 2, ch, 16);
        if (ec != std::errc() || ptr != first + 2) {
            return {};
        }
        out.push_back(std::bit_cast<char>(ch));
        idx += 3;
    }
    return out;
}

SPEECHWS_NS_END
