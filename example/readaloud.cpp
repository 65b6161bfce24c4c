/**
 * @file readaloud.cpp
 * @brief Synthesize one sentence with the read-aloud service and save the mp3
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */
#include <speechws/ws/websocket.hpp>
#include <speechws/endpoint.hpp>
#include <speechws/log.hpp>
#include <functional>
#include <fstream>
#include <cstdlib>
#include <utility>
#include <ctime>

using namespace SPEECHWS_NAMESPACE;
using namespace std::literals;

// The binary frames start with a 2 bytes big endian header length, then "Path:audio" headers
auto audioOf(Buffer data) -> Buffer {
    if (data.size() < 2) {
        return {};
    }
    auto len = (std::to_integer<size_t>(data[0]) << 8) | std::to_integer<size_t>(data[1]);
    if (data.size() < 2 + len) {
        return {};
    }
    auto headers = asStringView(data.subspan(2, len));
    if (headers.find("Path:audio") == headers.npos) {
        return {};
    }
    return data.subspan(2 + len);
}

auto timestamp() -> std::string {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmtlib::format("{:%a %b %d %Y %H:%M:%S} GMT+0000 (Coordinated Universal Time)", fmtlib::gmtime(now));
}

auto main(int argc, char **argv) -> int {
    if (argc < 2) {
        fmtlib::print("Usage: {} <text> [voice] [output.mp3]\n", argv[0]);
        return 1;
    }
    std::string text = argv[1];
    std::string voice = argc > 2 ? argv[2] : "en-US-AriaNeural";
    std::string output = argc > 3 ? argv[3] : "output.mp3";
    if (std::getenv("SPEECHWS_TRACE")) {
        SPEECHWS_LOG_SET_LEVEL(SPEECHWS_TRACE_LEVEL);
    }

    std::ofstream file(output, std::ios::binary);
    if (!file) {
        fmtlib::print("Can't open {}\n", output);
        return 1;
    }

    EventLoop loop;
    auth::SkewTracker skew;
    EdgeEndpoint endpoint(skew);
    std::unique_ptr<WebSocket> socket;
    std::function<void()> connect;
    bool retried = false;
    bool retry = false;
    int exitCode = 0;
    size_t audioBytes = 0;

    connect = [&]() {
        auto requestId = EdgeEndpoint::makeConnectionId();
        socket = std::make_unique<WebSocket>(loop);
        socket->setOnOpen([&, requestId]() {
            socket->send(fmtlib::format(
                "X-Timestamp:{}\r\nContent-Type:application/json; charset=utf-8\r\nPath:speech.config\r\n\r\n"
                R"({{"context":{{"synthesis":{{"audio":{{"metadataoptions":{{"sentenceBoundaryEnabled":"false","wordBoundaryEnabled":"true"}},"outputFormat":"audio-24khz-48kbitrate-mono-mp3"}}}}}}}})",
                timestamp()
            ));
            socket->send(fmtlib::format(
                "X-RequestId:{}\r\nContent-Type:application/ssml+xml\r\nX-Timestamp:{}Z\r\nPath:ssml\r\n\r\n"
                "<speak version='1.0' xmlns='http://www.w3.org/2001/10/synthesis' xml:lang='en-US'>"
                "<voice name='{}'><prosody pitch='+0Hz' rate='+0%' volume='+0%'>{}</prosody></voice></speak>",
                requestId, timestamp(), voice, text
            ), [](IoResult<void> res) {
                if (!res) {
                    SPEECHWS_ERROR("ReadAloud", "Failed to send the ssml: {}", res.error().message());
                }
            });
        });
        socket->setOnMessage([&](Buffer data, bool isBinary) {
            if (isBinary) {
                auto audio = audioOf(data);
                file.write(reinterpret_cast<const char *>(audio.data()), audio.size());
                audioBytes += audio.size();
                return;
            }
            if (asStringView(data).find("Path:turn.end") != std::string_view::npos) {
                socket->close();
            }
        });
        socket->setOnError([&](std::error_code ec) {
            // Refused because of a skewed clock, correct it by the server date and try once more
            auto date = socket->responseHeaders().value(HttpHeaders::Date);
            if (ec == WsError::BadHandshake && !retried && !date.empty() && skew.correct(date)) {
                SPEECHWS_WARN("ReadAloud", "Upgrade refused, retry with the corrected clock");
                retried = true;
                retry = true;
                return;
            }
            fmtlib::print("Error: {}\n", ec.message());
            exitCode = 1;
        });
        socket->setOnClose([&](const WebSocket::CloseInfo &info) {
            SPEECHWS_INFO("ReadAloud", "Closed: {}", info);
            if (std::exchange(retry, false)) {
                loop.post(connect); // Not inside the handler of the socket being replaced
                return;
            }
            loop.stop();
        });
        if (auto res = socket->open(endpoint.connectUrl(requestId), endpoint.options()); !res) {
            fmtlib::print("Open failed: {}\n", res.error().message());
            exitCode = 1;
            loop.stop();
        }
    };

    loop.post(connect);
    loop.run();
    if (exitCode == 0) {
        fmtlib::print("Wrote {} bytes of audio to {}\n", audioBytes, output);
    }
    return exitCode;
}
