#include <speechws/platform/epoll.hpp>
#include <speechws/log.hpp>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace SPEECHWS_NAMESPACE;
using namespace std::literals;

// Stop the loop if a test hangs
auto guard(EventLoop &loop) -> EventLoop::TimerId {
    return loop.callLater(5s, [&loop]() {
        ADD_FAILURE() << "Timeout";
        loop.stop();
    });
}

TEST(Epoll, Post) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&]() {
        order.push_back(1);
        loop.post([&]() {
            order.push_back(3);
            loop.stop();
        });
    });
    loop.post([&]() { order.push_back(2); });
    loop.run();
    ASSERT_EQ(order, (std::vector<int> {1, 2, 3}));
}

TEST(Epoll, PostFromThread) {
    EventLoop loop;
    auto id = guard(loop);
    bool called = false;
    std::thread thread([&]() {
        std::this_thread::sleep_for(20ms);
        loop.post([&]() {
            called = true;
            loop.stop();
        });
    });
    loop.run();
    thread.join();
    loop.cancelTimer(id);
    ASSERT_TRUE(called);
}

TEST(Epoll, Timer) {
    EventLoop loop;
    auto id = guard(loop);
    std::vector<int> order;
    auto begin = std::chrono::steady_clock::now();
    loop.callLater(30ms, [&]() {
        order.push_back(30);
        loop.stop();
    });
    loop.callLater(10ms, [&]() { order.push_back(10); });
    loop.callLater(0ms, [&]() { order.push_back(0); });
    loop.run();
    loop.cancelTimer(id);

    ASSERT_EQ(order, (std::vector<int> {0, 10, 30}));
    ASSERT_GE(std::chrono::steady_clock::now() - begin, 30ms);
}

TEST(Epoll, CancelTimer) {
    EventLoop loop;
    auto id = guard(loop);
    bool fired = false;
    auto timer = loop.callLater(10ms, [&]() { fired = true; });
    ASSERT_NE(timer, 0);
    ASSERT_TRUE(loop.cancelTimer(timer));
    ASSERT_FALSE(loop.cancelTimer(timer));

    loop.callLater(30ms, [&]() { loop.stop(); });
    loop.run();
    loop.cancelTimer(id);
    ASSERT_FALSE(fired);
}

TEST(Epoll, Descriptor) {
    EventLoop loop;
    auto id = guard(loop);
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    std::string received;
    auto res = loop.addDescriptor(fds[0], EPOLLIN, [&](uint32_t revents) {
        ASSERT_TRUE(revents & EPOLLIN);
        char buf[64];
        auto n = ::read(fds[0], buf, sizeof(buf));
        ASSERT_GT(n, 0);
        received.append(buf, n);
        if (received == "ping") {
            loop.stop();
        }
    });
    ASSERT_TRUE(res);

    // Same fd twice is an error
    ASSERT_FALSE(loop.addDescriptor(fds[0], EPOLLIN, [](uint32_t) { }));

    loop.callLater(10ms, [&]() {
        ASSERT_EQ(::write(fds[1], "ping", 4), 4);
    });
    loop.run();
    loop.cancelTimer(id);
    ASSERT_EQ(received, "ping");

    ASSERT_TRUE(loop.removeDescriptor(fds[0]));
    ASSERT_FALSE(loop.removeDescriptor(fds[0]));
    ::close(fds[0]);
    ::close(fds[1]);
}

auto main(int argc, char **argv) -> int {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
