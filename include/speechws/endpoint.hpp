/**
 * @file endpoint.hpp
 * @brief The urls and handshake headers of the speech services
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#pragma once

#include <speechws/ws/websocket.hpp>
#include <speechws/http/headers.hpp>
#include <speechws/auth/gec.hpp>
#include <string_view>
#include <string>

SPEECHWS_NS_BEGIN

/**
 * @brief The read-aloud service of the Edge browser
 *
 */
class SPEECHWS_API EdgeEndpoint {
public:
    struct Config {
        std::string trustedClientToken;
        std::string version;        //< The full browser version, like 143.0.3650.75
        std::string origin;
        std::string acceptLanguage;
    };

    static constexpr auto Host = std::string_view {"speech.platform.bing.com"};
    static constexpr auto BasePath = std::string_view {"/consumer/speech/synthesize/readaloud"};

    /**
     * @brief Construct with the constants of the browser extension
     *
     * @param skew The tracker shared by every url built here, must outlive the endpoint
     */
    explicit EdgeEndpoint(auth::SkewTracker &skew);
    EdgeEndpoint(auth::SkewTracker &skew, Config config);

    /**
     * @brief Build the websocket url, with a fresh token
     *
     * @param connectionId
     * @param now The local time
     * @return std::string
     */
    auto connectUrl(std::string_view connectionId, auth::Clock::time_point now = auth::Clock::now()) const -> std::string;

    /**
     * @brief Build the voice list url, with a fresh token
     *
     * @param now
     * @return std::string
     */
    auto voicesUrl(auth::Clock::time_point now = auth::Clock::now()) const -> std::string;

    /**
     * @brief Get the handshake headers, the cookie id is fresh on every call
     *
     * @return HttpHeaders
     */
    auto headers() const -> HttpHeaders;

    /**
     * @brief Get the options for WebSocket::open, host, origin and headers
     *
     * @return WebSocket::Options
     */
    auto options() const -> WebSocket::Options;

    auto host() const -> std::string_view { return Host; }
    auto origin() const -> std::string_view { return mConfig.origin; }
    auto config() const -> const Config & { return mConfig; }
    auto skew() const -> auth::SkewTracker & { return mSkew; }

    ///> @brief The Sec-MS-GEC-Version value, "1-" and the version
    auto secMsGecVersion() const -> std::string;

    ///> @brief 32 lowercase hex chars
    static auto makeConnectionId() -> std::string;

    static auto defaultConfig() -> Config;
private:
    auth::SkewTracker &mSkew;
    Config             mConfig;
};

/**
 * @brief The Azure speech service, keyed by region
 *
 */
class SPEECHWS_API AzureEndpoint {
public:
    /**
     * @brief Create the endpoint
     *
     * @param region like eastus
     * @param key The subscription key
     * @return IoResult<AzureEndpoint> (IoError::InvalidArgument on an empty region or key)
     */
    static auto make(std::string_view region, std::string_view key) -> IoResult<AzureEndpoint>;

    auto connectUrl(std::string_view connectionId) const -> std::string;
    auto voicesUrl() const -> std::string;
    auto headers() const -> HttpHeaders;
    auto options() const -> WebSocket::Options;
    auto host() const -> std::string;
    auto origin() const -> std::string;
    auto region() const -> std::string_view { return mRegion; }
private:
    AzureEndpoint(std::string_view region, std::string_view key) : mRegion(region), mKey(key) { }

    std::string mRegion;
    std::string mKey;
};

SPEECHWS_NS_END
