#include <speechws/url.hpp>
#include <gtest/gtest.h>

using namespace SPEECHWS_NAMESPACE;

TEST(UrlTest, ValidUrl) {
    Url url("https://www.google.com");
    ASSERT_EQ(url.scheme(), "https");
    ASSERT_EQ(url.port(), std::nullopt);
    ASSERT_EQ(url.effectivePort(), 443);
    ASSERT_EQ(url.host(), "www.google.com");
    ASSERT_EQ(url.path(), "/");
    ASSERT_EQ(url.toString(), "https://www.google.com");
    ASSERT_TRUE(url.isValid());

    url = "https://www.google.com:10086/path";
    ASSERT_EQ(url.scheme(), "https");
    ASSERT_EQ(url.port(), 10086);
    ASSERT_EQ(url.effectivePort(), 10086);
    ASSERT_EQ(url.host(), "www.google.com");
    ASSERT_EQ(url.path(), "/path");
    ASSERT_TRUE(url.isValid());

    url = "ws://127.0.0.4:123";
    ASSERT_EQ(url.host(), "127.0.0.4");
    ASSERT_EQ(url.port(), 123);
    ASSERT_EQ(url.path(), "/");
    ASSERT_TRUE(url.isValid());

    url = "wss://speech.platform.bing.com/consumer/speech/synthesize/readaloud/edge/v1?TrustedClientToken=abc&ConnectionId=1#frag";
    ASSERT_EQ(url.scheme(), "wss");
    ASSERT_EQ(url.effectivePort(), 443);
    ASSERT_EQ(url.host(), "speech.platform.bing.com");
    ASSERT_EQ(url.path(), "/consumer/speech/synthesize/readaloud/edge/v1");
    ASSERT_EQ(url.query(), "TrustedClientToken=abc&ConnectionId=1");
    ASSERT_EQ(url.target(), "/consumer/speech/synthesize/readaloud/edge/v1?TrustedClientToken=abc&ConnectionId=1");
    ASSERT_TRUE(url.isValid());

    url.setHost("example/aaa.com");
    ASSERT_FALSE(url.isValid());

    // No scheme
    url = "www.google.com";
    ASSERT_FALSE(url.isValid());
    ASSERT_EQ(url.effectivePort(), std::nullopt);
}

TEST(UrlTest, QueryItem) {
    Url url("wss://example.com/path");
    url.addQueryItem("a", "1");
    url.addQueryItem("b", "x y");
    ASSERT_EQ(url.query(), "a=1&b=x%20y");
    ASSERT_EQ(url.toString(), "wss://example.com/path?a=1&b=x%20y");
}

TEST(UrlTest, Encode) {
    ASSERT_EQ(Url::encodeComponent("Hello, World!"), "Hello%2C%20World%21");
    ASSERT_EQ(Url::decodeComponent("Hello%2C%20World%21"), "Hello, World!");
    ASSERT_EQ(Url::decodeComponent("Hello%2C%20World%21%3F%3F"), "Hello, World!??");

    // Unicode
    ASSERT_EQ(Url::encodeComponent("你好，世界！"), "%E4%BD%A0%E5%A5%BD%EF%BC%8C%E4%B8%96%E7%95%8C%EF%BC%81");
    ASSERT_EQ(Url::decodeComponent("%E4%BD%A0%E5%A5%BD%EF%BC%8C%E4%B8%96%E7%95%8C%EF%BC%81"), "你好，世界！");

    // Malformed
    ASSERT_EQ(Url::decodeComponent("abc%2"), "");
    ASSERT_EQ(Url::decodeComponent("abc%zz"), "");
}

TEST(UrlTest, SafeString) {
    ASSERT_TRUE(Url::isSafeString("westus2"));
    ASSERT_TRUE(Url::isSafeString("a-b_c.d~"));
    ASSERT_FALSE(Url::isSafeString("west us"));
    ASSERT_FALSE(Url::isSafeString("evil.com/x"));
    ASSERT_EQ(Url::encodeComponent("a-b_c.d~"), "a-b_c.d~");
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
