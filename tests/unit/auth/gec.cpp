#include <speechws/auth/gec.hpp>
#include <speechws/ws/error.hpp>
#include <gtest/gtest.h>

using namespace SPEECHWS_NAMESPACE;
using namespace SPEECHWS_NAMESPACE::auth;
using namespace std::chrono;
using namespace std::literals;

auto fromUnix(int64_t secs) -> Clock::time_point {
    return Clock::time_point(seconds(secs));
}

TEST(Gec, WindowTicks) {
    ASSERT_EQ(windowTicks(fromUnix(0)), 116444736000000000);
    ASSERT_EQ(windowTicks(fromUnix(299)), 116444736000000000);
    ASSERT_EQ(windowTicks(fromUnix(300)), 116444739000000000);

    // Sub second part is dropped
    ASSERT_EQ(windowTicks(fromUnix(299) + 999ms), 116444736000000000);
}

TEST(Gec, KnownTokens) {
    SkewTracker skew;
    ASSERT_EQ(generateSecMsGec(skew, fromUnix(0)), "7ECB79D14E3AA576D2D79E6D487A1388156D91E614B1BE11C64226A29BC8DD8C");
    ASSERT_EQ(generateSecMsGec(skew, fromUnix(1719837296)), "BAD75CF1C46D69C7236D8CB5B84FEED1ADB9792225848221BE521D8935917102");
    ASSERT_EQ(generateSecMsGec(skew, fromUnix(1719837300)), "BF4C7B13BDF1736133D9BB99FF9F89D5C446B9D23EA74732DBE55632710FCEF1");
}

TEST(Gec, SameWindow) {
    SkewTracker skew;
    auto token = generateSecMsGec(skew, fromUnix(1719837000));
    ASSERT_EQ(token.size(), 64);
    ASSERT_EQ(generateSecMsGec(skew, fromUnix(1719837299)), token);
    ASSERT_EQ(generateSecMsGec(skew, fromUnix(1719837150) + 500ms), token);

    // Adjacent windows
    ASSERT_NE(generateSecMsGec(skew, fromUnix(1719836999)), token);
    ASSERT_NE(generateSecMsGec(skew, fromUnix(1719837300)), token);
}

TEST(Gec, ParseHttpDate) {
    ASSERT_EQ(parseHttpDate("Mon, 01 Jul 2024 12:34:56 GMT"), fromUnix(1719837296));
    ASSERT_EQ(parseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT"), fromUnix(784111777));
    ASSERT_EQ(parseHttpDate("Sunday, 06-Nov-94 08:49:37 GMT"), fromUnix(784111777));
    ASSERT_EQ(parseHttpDate("Sun Nov  6 08:49:37 1994"), fromUnix(784111777));

    ASSERT_EQ(parseHttpDate(""), std::nullopt);
    ASSERT_EQ(parseHttpDate("yesterday"), std::nullopt);
    ASSERT_EQ(parseHttpDate("Mon, 32 Jul 2024 12:34:56 GMT"), std::nullopt);
    ASSERT_EQ(parseHttpDate("Mon, 01 Foo 2024 12:34:56 GMT"), std::nullopt);
    ASSERT_EQ(parseHttpDate("Mon, 01 Jul 2024 25:34:56 GMT"), std::nullopt);
}

TEST(Gec, SkewCorrection) {
    SkewTracker skew;
    auto local = fromUnix(1719837000 - 3600); // One hour behind the server

    ASSERT_TRUE(skew.correct("Mon, 01 Jul 2024 12:34:56 GMT", local));
    ASSERT_EQ(skew.skew(), seconds(1719837296 - (1719837000 - 3600)));
    ASSERT_EQ(skew.correctedNow(local), fromUnix(1719837296));

    // The token follows the server window now
    ASSERT_EQ(generateSecMsGec(skew, local), "BAD75CF1C46D69C7236D8CB5B84FEED1ADB9792225848221BE521D8935917102");

    // Cumulative, a second correction against the same server time is a no-op
    ASSERT_TRUE(skew.correct("Mon, 01 Jul 2024 12:34:56 GMT", local));
    ASSERT_EQ(skew.correctedNow(local), fromUnix(1719837296));

    // Local clock moved 10s, server says 5s
    ASSERT_TRUE(skew.correct("Mon, 01 Jul 2024 12:35:01 GMT", local + 10s));
    ASSERT_EQ(skew.correctedNow(local + 10s), fromUnix(1719837301));
}

TEST(Gec, InvalidDateKeepsSkew) {
    SkewTracker skew(1500ms);
    auto res = skew.correct("not a date", fromUnix(0));
    ASSERT_FALSE(res);
    ASSERT_EQ(res.error(), WsError::InvalidSkewDate);
    ASSERT_EQ(skew.skew(), 1500ms);
}

TEST(Gec, CustomClientToken) {
    SkewTracker skew;
    ASSERT_EQ(generateSecMsGec(skew, fromUnix(0), TrustedClientToken), generateSecMsGec(skew, fromUnix(0)));
    ASSERT_NE(generateSecMsGec(skew, fromUnix(0), "OTHER"), generateSecMsGec(skew, fromUnix(0)));
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
