#include <gtest/gtest.h>
#include <streamview/core/uv_scheduler.hpp>
#include <streamview/net/datachannel_websocket.hpp>

#include <thread>

namespace streamview::net::test {

using namespace std::chrono_literals;

class DataChannelWebSocketTest : public ::testing::Test {
protected:
    core::UvScheduler scheduler;
};

TEST_F(DataChannelWebSocketTest, ConfigurationCapsMessageSize) {
    auto config = DataChannelWebSocket::configuration();
    ASSERT_TRUE(config.maxMessageSize.has_value());
    EXPECT_EQ(*config.maxMessageSize, DataChannelWebSocket::kMaxMessageSize);
    ASSERT_TRUE(config.connectionTimeout.has_value());
    EXPECT_EQ(*config.connectionTimeout, DataChannelWebSocket::kConnectionTimeout);
}

TEST_F(DataChannelWebSocketTest, RejectsNonWebSocketUrls) {
    auto channel = DataChannelWebSocket::create(scheduler);

    try {
        channel->open("http://127.0.0.1:8083/api/webrtc/ws");
        FAIL() << "Expected core::Error";
    }
    catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::InvalidAddress);
    }
    EXPECT_THROW(channel->open("not a url"), core::Error);
}

TEST_F(DataChannelWebSocketTest, AcceptsSecureUrls) {
    auto channel = DataChannelWebSocket::create(scheduler);
    EXPECT_NO_THROW(channel->open("wss://127.0.0.1:1/api/webrtc/ws"));
    EXPECT_FALSE(channel->isOpen());
    channel->close();
}

TEST_F(DataChannelWebSocketTest, SendBeforeOpenFails) {
    auto channel = DataChannelWebSocket::create(scheduler);
    EXPECT_FALSE(channel->send("{\"type\":\"offer\"}"));
}

TEST_F(DataChannelWebSocketTest, CloseIsIdempotent) {
    auto channel = DataChannelWebSocket::create(scheduler);
    channel->close();
    channel->close();

    EXPECT_FALSE(channel->isOpen());
    try {
        channel->open("ws://127.0.0.1:8083/api/webrtc/ws");
        FAIL() << "Expected core::Error";
    }
    catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::InvalidState);
    }
}

TEST_F(DataChannelWebSocketTest, RefusedConnectionIsReportedOnLoopThread) {
    auto channel = DataChannelWebSocket::create(scheduler);

    bool opened = false;
    bool reported = false;
    std::thread::id reported_on;

    auto guard = scheduler.schedule(5000ms, [this]() { scheduler.stop(); });
    auto report = [&]() {
        if (reported) return;
        reported = true;
        reported_on = std::this_thread::get_id();
        scheduler.stop();
    };

    MessageChannel::Handlers handlers;
    handlers.on_open = [&]() { opened = true; };
    handlers.on_error = [&](const std::string&) { report(); };
    handlers.on_close = [&]() { report(); };
    channel->setHandlers(std::move(handlers));

    // Nothing listens on port 1
    channel->open("ws://127.0.0.1:1/api/webrtc/ws");
    scheduler.run();
    scheduler.cancel(guard);

    EXPECT_FALSE(opened);
    EXPECT_TRUE(reported);
    EXPECT_EQ(reported_on, std::this_thread::get_id());
    EXPECT_FALSE(channel->isOpen());
}

TEST_F(DataChannelWebSocketTest, NoCallbacksAfterClose) {
    auto channel = DataChannelWebSocket::create(scheduler);

    bool called = false;
    MessageChannel::Handlers handlers;
    handlers.on_open = [&]() { called = true; };
    handlers.on_error = [&](const std::string&) { called = true; };
    handlers.on_close = [&]() { called = true; };
    channel->setHandlers(std::move(handlers));

    channel->open("ws://127.0.0.1:1/api/webrtc/ws");
    channel->close();

    auto guard = scheduler.schedule(200ms, [this]() { scheduler.stop(); });
    scheduler.run();
    scheduler.cancel(guard);

    EXPECT_FALSE(called);
}

} // namespace streamview::net::test
