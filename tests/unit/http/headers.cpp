#include <speechws/http/headers.hpp>
#include <gtest/gtest.h>

using namespace SPEECHWS_NAMESPACE;

TEST(HttpHeaders, CaseInsensitive) {
    HttpHeaders headers;
    headers.append("Content-Type", "text/plain");
    ASSERT_TRUE(headers.contains("content-type"));
    ASSERT_TRUE(headers.contains(HttpHeaders::ContentType));
    ASSERT_EQ(headers.value("CONTENT-TYPE"), "text/plain");
    ASSERT_EQ(headers.value("Missing"), "");
}

TEST(HttpHeaders, Order) {
    HttpHeaders headers {
        {"User-Agent", "test"},
        {"Cookie", "a=1"},
        {"Accept", "*/*"},
    };
    headers.append("Cookie", "b=2");
    ASSERT_EQ(headers.size(), 4);
    ASSERT_EQ(headers.values(HttpHeaders::Cookie), (std::vector<std::string_view> {"a=1", "b=2"}));
    ASSERT_EQ(fmtlib::format("{}", headers), "User-Agent: test\r\nCookie: a=1\r\nAccept: */*\r\nCookie: b=2\r\n");

    headers.set("cookie", "c=3");
    ASSERT_EQ(headers.values("Cookie"), (std::vector<std::string_view> {"c=3"}));
    ASSERT_EQ(fmtlib::format("{}", headers), "User-Agent: test\r\nCookie: c=3\r\nAccept: */*\r\n"); // set keeps the position

    headers.remove(HttpHeaders::UserAgent);
    ASSERT_FALSE(headers.contains("User-Agent"));
    ASSERT_EQ(headers.size(), 2);
}

TEST(HttpHeaders, Parse) {
    auto headers = HttpHeaders::parse(
        "Upgrade: websocket\r\n"
        "Connection:Upgrade\r\n"
        "garbage line\r\n"
        "Sec-WebSocket-Accept:  s3pPLMBiTxaQ9kYGzzhZRbK+xOo=  \n"
        "Date: Mon, 01 Jul 2024 12:34:56 GMT"
    );
    ASSERT_EQ(headers.size(), 4);
    ASSERT_EQ(headers.value(HttpHeaders::Upgrade), "websocket");
    ASSERT_EQ(headers.value(HttpHeaders::Connection), "Upgrade");
    ASSERT_EQ(headers.value(HttpHeaders::SecWebSocketAccept), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    ASSERT_EQ(headers.value(HttpHeaders::Date), "Mon, 01 Jul 2024 12:34:56 GMT");

    ASSERT_TRUE(HttpHeaders::parse("").empty());
}

TEST(HttpHeaders, WellKnown) {
    ASSERT_EQ(HttpHeaders::stringOf(HttpHeaders::SecWebSocketKey), "Sec-WebSocket-Key");
    ASSERT_EQ(fmtlib::format("{}", HttpHeaders::UserAgent), "User-Agent");
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
