#include <speechws/buffer.hpp>
#include <gtest/gtest.h>

using namespace SPEECHWS_NAMESPACE;
using namespace SPEECHWS_NAMESPACE::literals;
using namespace std::literals;

TEST(Buffer, MakeBuffer) {
    auto text = "hello"sv;
    auto buf = makeBuffer(text);
    ASSERT_EQ(buf.size(), 5);
    ASSERT_EQ(asStringView(buf), "hello");

    auto bytes = toBytes(buf);
    ASSERT_EQ(bytes.size(), 5);
    ASSERT_EQ(bytes[0], std::byte('h'));

    ASSERT_EQ(asStringView("abc"_bin), "abc");
}

TEST(StreamBuffer, PrepareCommitConsume) {
    StreamBuffer buf;
    ASSERT_TRUE(buf.empty());

    auto out = buf.prepare(5);
    ASSERT_EQ(out.size(), 5);
    ::memcpy(out.data(), "hello", 5);
    buf.commit(5);
    ASSERT_EQ(asStringView(buf.data()), "hello");

    ASSERT_TRUE(buf.append(makeBuffer(" world"sv)));
    ASSERT_EQ(asStringView(buf.data()), "hello world");

    buf.consume(6);
    ASSERT_EQ(asStringView(buf.data()), "world");
    ASSERT_EQ(buf.size(), 5);

    buf.consume(5);
    ASSERT_TRUE(buf.empty());

    // Rewind on the next prepare
    ASSERT_TRUE(buf.append(makeBuffer("again"sv)));
    ASSERT_EQ(asStringView(buf.data()), "again");

    buf.clear();
    ASSERT_TRUE(buf.empty());
}

TEST(StreamBuffer, MaxCapacity) {
    StreamBuffer buf(8);
    ASSERT_EQ(buf.maxCapacity(), 8);
    ASSERT_TRUE(buf.append(makeBuffer("12345678"sv)));
    ASSERT_FALSE(buf.append(makeBuffer("9"sv)));
    ASSERT_TRUE(buf.prepare(1).empty());

    // Space comes back after consuming
    buf.consume(4);
    ASSERT_TRUE(buf.append(makeBuffer("abcd"sv)));
    ASSERT_EQ(asStringView(buf.data()), "5678abcd");
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
