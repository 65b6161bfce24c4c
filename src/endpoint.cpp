/**
 * @file endpoint.cpp
 * @brief The urls and handshake headers of the speech services
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#include <speechws/endpoint.hpp>
#include <speechws/crypt.hpp>
#include <speechws/log.hpp>
#include <speechws/url.hpp>

SPEECHWS_NS_BEGIN

// MARK: Edge
EdgeEndpoint::EdgeEndpoint(auth::SkewTracker &skew) : EdgeEndpoint(skew, defaultConfig()) {

}

EdgeEndpoint::EdgeEndpoint(auth::SkewTracker &skew, Config config) : mSkew(skew), mConfig(std::move(config)) {

}

auto EdgeEndpoint::defaultConfig() -> Config {
    return Config {
        .trustedClientToken = std::string(auth::TrustedClientToken),
        .version = "143.0.3650.75",
        .origin = "chrome-extension://jdiccldimpdaibmpdkjnbmckianbfold",
        .acceptLanguage = "en-US,en;q=0.9",
    };
}

auto EdgeEndpoint::secMsGecVersion() const -> std::string {
    return "1-" + mConfig.version;
}

auto EdgeEndpoint::connectUrl(std::string_view connectionId, auth::Clock::time_point now) const -> std::string {
    auto url = Url(fmtlib::format("wss://{}{}/edge/v1", Host, BasePath));
    url.addQueryItem("TrustedClientToken", mConfig.trustedClientToken);
    url.addQueryItem("ConnectionId", connectionId);
    url.addQueryItem("Sec-MS-GEC", auth::generateSecMsGec(mSkew, now, mConfig.trustedClientToken));
    url.addQueryItem("Sec-MS-GEC-Version", secMsGecVersion());
    return url.toString();
}

auto EdgeEndpoint::voicesUrl(auth::Clock::time_point now) const -> std::string {
    auto url = Url(fmtlib::format("https://{}{}/voices/list", Host, BasePath));
    url.addQueryItem("trustedclienttoken", mConfig.trustedClientToken);
    url.addQueryItem("Sec-MS-GEC", auth::generateSecMsGec(mSkew, now, mConfig.trustedClientToken));
    url.addQueryItem("Sec-MS-GEC-Version", secMsGecVersion());
    return url.toString();
}

auto EdgeEndpoint::headers() const -> HttpHeaders {
    auto major = std::string_view(mConfig.version).substr(0, mConfig.version.find('.'));
    HttpHeaders headers;
    headers.append(
        HttpHeaders::UserAgent,
        fmtlib::format(
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
            "Chrome/{0}.0.0.0 Safari/537.36 Edg/{0}.0.0.0",
            major
        )
    );
    headers.append(HttpHeaders::AcceptEncoding, "gzip, deflate, br, zstd");
    headers.append(HttpHeaders::AcceptLanguage, mConfig.acceptLanguage);
    headers.append(HttpHeaders::Pragma, "no-cache");
    headers.append(HttpHeaders::CacheControl, "no-cache");
    headers.append(HttpHeaders::Cookie, "MUID=" + hex::encode(randomBytes(16), hex::Upper));
    return headers;
}

auto EdgeEndpoint::options() const -> WebSocket::Options {
    WebSocket::Options options;
    options.host = Host;
    options.origin = mConfig.origin;
    options.headers = headers();
    return options;
}

auto EdgeEndpoint::makeConnectionId() -> std::string {
    return hex::encode(randomBytes(16), hex::Lower);
}

// MARK: Azure
auto AzureEndpoint::make(std::string_view region, std::string_view key) -> IoResult<AzureEndpoint> {
    if (region.empty() || key.empty()) {
        SPEECHWS_ERROR("Endpoint", "Azure speech needs both a region and a subscription key");
        return Err(IoError::InvalidArgument);
    }
    if (!Url::isSafeString(region)) {
        SPEECHWS_ERROR("Endpoint", "Invalid azure region '{}'", region);
        return Err(IoError::InvalidArgument);
    }
    return AzureEndpoint(region, key);
}

auto AzureEndpoint::host() const -> std::string {
    return fmtlib::format("{}.tts.speech.microsoft.com", mRegion);
}

auto AzureEndpoint::origin() const -> std::string {
    return "https://" + host();
}

auto AzureEndpoint::connectUrl(std::string_view connectionId) const -> std::string {
    auto url = Url(fmtlib::format("wss://{}/cognitiveservices/websocket/v1", host()));
    url.addQueryItem("ConnectionId", connectionId);
    return url.toString();
}

auto AzureEndpoint::voicesUrl() const -> std::string {
    return fmtlib::format("https://{}/cognitiveservices/voices/list", host());
}

auto AzureEndpoint::headers() const -> HttpHeaders {
    return HttpHeaders {
        {"Ocp-Apim-Subscription-Key", mKey}
    };
}

auto AzureEndpoint::options() const -> WebSocket::Options {
    WebSocket::Options options;
    options.host = host();
    options.origin = origin();
    options.headers = headers();
    return options;
}

SPEECHWS_NS_END
